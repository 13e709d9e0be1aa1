#include <gtest/gtest.h>

#include <libfusfetch/FirmwareCatalog.hpp>
#include <libfusfetch/FUSException.hpp>
#include "MockTransport.hpp"

using namespace tihmstar::libfusfetch;
using namespace fusfetch_test;

static const char *kManifest =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<versioninfo>\n"
    "  <url>http://fota-cloud-dn.ospserver.net:80/firmware/</url>\n"
    "  <firmware>\n"
    "    <model>SM-G960F</model>\n"
    "    <cc>EUX</cc>\n"
    "    <version>\n"
    "      <latest o=\"10\">G960FXXUHFVG4/G960FOXMHFVG4/G960FXXUHFVG4/G960FXXUHFVG4</latest>\n"
    "      <upgrade>\n"
    "        <value rcount=\"0\" fwsize=\"\">G960FXXU1ASCD/G960FOXM1ASC1/G960FXXU1ASCD/G960FXXU1ASCD</value>\n"
    "        <value rcount=\"0\" fwsize=\"\">G960FXXU1ARCC</value>\n"
    "        <value rcount=\"0\" fwsize=\"\">G960FXXS2ASD1/G960FOXM2ASC3/</value>\n"
    "      </upgrade>\n"
    "    </version>\n"
    "  </firmware>\n"
    "</versioninfo>\n";

TEST(FirmwareCatalog, ParseLatestFirstThenAlternates) {
    std::vector<CatalogEntry> entries = parseCatalog(kManifest);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_TRUE(entries[0].isLatest);
    EXPECT_EQ(entries[0].firmware.str(), "G960FXXUHFVG4/G960FOXMHFVG4/G960FXXUHFVG4/G960FXXUHFVG4");
    EXPECT_EQ(entries[0].buildInfo.bl(), "UH");
    EXPECT_EQ(entries[0].buildInfo.date(), "2022.6");

    EXPECT_FALSE(entries[1].isLatest);
    EXPECT_EQ(entries[1].firmware.str(), "G960FXXU1ASCD/G960FOXM1ASC1/G960FXXU1ASCD/G960FXXU1ASCD");
    EXPECT_EQ(entries[1].buildInfo.year, 2019);
    //single component placeholder is dropped, empty third component is filled from the first
    EXPECT_EQ(entries[2].firmware.str(), "G960FXXS2ASD1/G960FOXM2ASC3/G960FXXS2ASD1/G960FXXS2ASD1");
}

TEST(FirmwareCatalog, SingleUpgradeValue) {
    std::vector<CatalogEntry> entries = parseCatalog(
        "<versioninfo><firmware><version><latest>A1XXU1ASCD/B/C</latest>"
        "<upgrade><value>A1XXU1ARCC/B/C/D</value></upgrade></version></firmware></versioninfo>");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].firmware.str(), "A1XXU1ASCD/B/C/A1XXU1ASCD");
    EXPECT_EQ(entries[1].firmware.str(), "A1XXU1ARCC/B/C/D");
}

TEST(FirmwareCatalog, NoUpgradeSection) {
    std::vector<CatalogEntry> entries = parseCatalog(
        "<versioninfo><firmware><version><latest>A1XXU1ASCD/B/C/D</latest><upgrade/></version></firmware></versioninfo>");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].isLatest);
}

TEST(FirmwareCatalog, EmptyManifest) {
    EXPECT_THROW(parseCatalog("<versioninfo/>"), CatalogEmptyError);
    EXPECT_THROW(parseCatalog("<versioninfo><firmware/></versioninfo>"), CatalogEmptyError);
    EXPECT_THROW(parseCatalog("<other/>"), CatalogEmptyError);
}

TEST(FirmwareCatalog, UnparseableManifest) {
    EXPECT_THROW(parseCatalog("not xml at all"), CatalogUnparseableError);
    EXPECT_THROW(parseCatalog("<versioninfo><firmware><version><latest>G960F</latest></version></firmware></versioninfo>"), CatalogUnparseableError);
    EXPECT_THROW(parseCatalog("<versioninfo><firmware><version></version></firmware></versioninfo>"), CatalogUnparseableError);
}

TEST(FirmwareCatalog, FetchesManifestForRegionAndModel) {
    FUSConfig config = FUSConfig::defaults();
    MockTransport t;
    std::string url = "http://fota-cloud-dn.ospserver.net/firmware/EUX/SM-G960F/version.xml";
    t.on(url, makeResponse(200, kManifest));

    FirmwareCatalog catalog(t, config);
    EXPECT_EQ(catalog.latest("EUX", "SM-G960F").str(), "G960FXXUHFVG4/G960FOXMHFVG4/G960FXXUHFVG4/G960FXXUHFVG4");
    EXPECT_EQ(catalog.listVersions("EUX", "SM-G960F").size(), 3u);
    ASSERT_EQ(t.requests.size(), 2u);
    EXPECT_EQ(t.requests[0].method, "GET");
    EXPECT_EQ(t.requests[0].url, url);
}

TEST(FirmwareCatalog, UnknownDevice) {
    FUSConfig config = FUSConfig::defaults();
    MockTransport t;
    FirmwareCatalog catalog(t, config);
    try {
        catalog.listVersions("EUX", "SM-NOPE");
        FAIL() << "expected ServerRejectedError";
    } catch (ServerRejectedError &e) {
        EXPECT_EQ(e.status(), 404);
    }
}

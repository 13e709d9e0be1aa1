//
//  DeviceIdentity.cpp
//  libfusfetch
//
//  Created by tihmstar on 05.06.25.
//

#include "../include/libfusfetch/DeviceIdentity.hpp"

#include <libgeneral/macros.h>

#include <ctype.h>
#include <fstream>
#include <random>
#include <sstream>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#define IMEI_LENGTH 15

#pragma mark private
static std::string trim(const std::string &s){
    size_t b = s.find_first_not_of(" \t\r\n\"");
    if (b == std::string::npos) return "";
    return s.substr(b, s.find_last_not_of(" \t\r\n\"") - b + 1);
}

static int randomDigit(){
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0,9);
    return dist(gen);
}

#pragma mark public
LIBFUSFETCH_API int libfusfetch::luhnCheckDigit(const std::string &digits){
    int sum = 0;
    //walk from the right, doubling every second digit starting with the rightmost payload digit
    for (size_t i = 0; i < digits.size(); i++) {
        char c = digits[digits.size()-1-i];
        retassure(isdigit((unsigned char)c), "Non-digit '%c' in '%s'",c,digits.c_str());
        int d = c - '0';
        if ((i & 1) == 0) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
    }
    return (10 - (sum % 10)) % 10;
}

LIBFUSFETCH_API std::string libfusfetch::generateIMEI(const std::string &tac, DigitSource rng){
    std::string ret = trim(tac);
    retassure(ret.size() < IMEI_LENGTH, "TAC '%s' too long",tac.c_str());
    if (!rng) rng = randomDigit;

    while (ret.size() < IMEI_LENGTH-1) {
        int d = rng();
        retassure(d >= 0 && d <= 9, "Digit source returned %d",d);
        ret += (char)('0' + d);
    }
    ret += (char)('0' + luhnCheckDigit(ret));
    return ret;
}

#pragma mark TacTable
TacTable TacTable::fromCSV(const std::string &path){
    std::ifstream f(path);
    retassure(f.is_open(), "Failed to open TAC table '%s'",path.c_str());
    std::stringstream ss;
    ss << f.rdbuf();
    return fromCSVString(ss.str());
}

TacTable TacTable::fromCSVString(const std::string &csv){
    TacTable ret;
    std::istringstream lines(csv);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream cols(line);
        std::string tac;
        std::string model;
        if (!std::getline(cols, tac, ',')) continue;
        tac = trim(tac);
        if (tac.empty() || !isdigit((unsigned char)tac[0])) continue; //header or garbage
        while (std::getline(cols, model, ',')) {
            model = trim(model);
            if (model.size()) ret.add(tac, model);
        }
    }
    return ret;
}

void TacTable::add(const std::string &tac, const std::string &model){
    //first row mentioning a model wins
    _tacForModel.emplace(model, tac);
}

const std::string *TacTable::tacForModel(const std::string &model) const{
    auto it = _tacForModel.find(model);
    return (it != _tacForModel.end()) ? &it->second : NULL;
}

// include/json_min.h
#pragma once
#include <string>

std::string jsonEscape(const std::string& s);
std::string jsonQuote(const std::string& s);   // escaped and wrapped in quotes

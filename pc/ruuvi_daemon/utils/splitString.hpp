/*
 * splitString.hpp
 *
 *  Created on: 8 mrt. 2025
 */

#ifndef UTILS_SPLITSTRING_HPP_
#define UTILS_SPLITSTRING_HPP_
#include <map>
#include <string>
#include <vector>

std::vector<std::string> splitString(const std::string &str, const std::string &delimiter = " ",
                                     const unsigned int max_elements = 0);

// "key=value" tokens, leading dashes on the key are ignored
std::map<std::string, std::string> parseKeyValue(const std::vector<std::string> &);

std::string toUpper(std::string str);
std::string toLower(std::string str);

#endif /* UTILS_SPLITSTRING_HPP_ */

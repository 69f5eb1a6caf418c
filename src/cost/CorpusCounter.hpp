#pragma once
#include "NgramTables.hpp"
#include <istream>
#include <string>

/**
 * @brief Counts uni/bi/tri-gram frequencies of a text.
 *
 * Text is lower-cased and every character outside allowedAlphabet is dropped
 * before counting; n-grams are overlapping windows over the filtered stream,
 * so they may span removed characters (spaces, newlines).
 */
NgramFrequencies countNgrams(std::istream& text, const std::string& allowedAlphabet);

/**
 * @throws std::runtime_error if the file cannot be opened.
 */
NgramFrequencies countNgramsInFile(const std::string& path, const std::string& allowedAlphabet);

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "track/types.hpp"

namespace track {

// Splits one CSV line; supports quoted fields and "" escapes.
bool split_csv_line(const std::string& line,
                    std::vector<std::string>& out,
                    std::string* err = nullptr);

// One field -> open record, two fields -> closed record, else nullopt.
std::optional<Record> decode_record(const std::vector<std::string>& fields);

// Serializes r as one line terminated by a single '\n'.
std::string encode_record(const Record& r);

} // namespace track

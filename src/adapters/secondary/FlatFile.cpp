#include "adapters/secondary/FlatFile.hpp"
#include "domain/WalletException.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace wallet::adapters::secondary {

using domain::ErrorKind;
using domain::WalletException;

std::string FlatFile::readAll(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        std::cerr << "[FlatFile] " << path << " is a directory" << std::endl;
        throw WalletException(ErrorKind::FILE_NOT_FOUND, "not a regular file: " + path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[FlatFile] Cannot open " << path << " for reading" << std::endl;
        throw WalletException(ErrorKind::FILE_NOT_FOUND, "file not found: " + path);
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        std::cerr << "[FlatFile] Read failed: " << path << std::endl;
        throw WalletException(ErrorKind::FILE_NOT_FOUND, "cannot read file: " + path);
    }
    return content.str();
}

void FlatFile::writeAll(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "[FlatFile] Cannot open " << path << " for writing" << std::endl;
        throw WalletException(ErrorKind::FILE_NOT_FOUND, "file not found: " + path);
    }

    out << content;
    out.flush();
    if (!out) {
        std::cerr << "[FlatFile] Write failed: " << path << std::endl;
        throw WalletException(ErrorKind::FILE_NOT_FOUND, "cannot write file: " + path);
    }

    out.close();
    if (out.fail()) {
        std::cerr << "[FlatFile] Close failed: " << path << std::endl;
    }
}

std::vector<std::string> FlatFile::splitRecords(const std::string& content, char terminator) {
    std::vector<std::string> records;
    boost::algorithm::split(records, content, boost::algorithm::is_any_of(std::string(1, terminator)));

    if (!records.empty()) {
        records.pop_back();
    }
    return records;
}

std::vector<std::string> FlatFile::splitFields(const std::string& record) {
    std::vector<std::string> fields;
    boost::algorithm::split(fields, record, boost::algorithm::is_any_of(";"));
    return fields;
}

int64_t FlatFile::parseInt(const std::string& field, const std::string& context) {
    if (field.empty() || std::isspace(static_cast<unsigned char>(field.front()))) {
        throw WalletException(ErrorKind::PARSE_ERROR,
            "invalid integer '" + field + "' in " + context);
    }

    try {
        size_t pos = 0;
        int64_t value = std::stoll(field, &pos);
        if (pos != field.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw WalletException(ErrorKind::PARSE_ERROR,
            "invalid integer '" + field + "' in " + context);
    } catch (const std::out_of_range&) {
        throw WalletException(ErrorKind::PARSE_ERROR,
            "integer out of range '" + field + "' in " + context);
    }
}

void FlatFile::requireFields(
    const std::vector<std::string>& fields,
    size_t expected,
    const std::string& context
) {
    if (fields.size() < expected) {
        throw WalletException(ErrorKind::PARSE_ERROR,
            "expected " + std::to_string(expected) + " fields, got "
            + std::to_string(fields.size()) + " in " + context);
    }
}

} // namespace wallet::adapters::secondary

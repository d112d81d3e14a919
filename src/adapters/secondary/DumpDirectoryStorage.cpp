#include "adapters/secondary/DumpDirectoryStorage.hpp"
#include "adapters/secondary/FlatFile.hpp"
#include "domain/WalletException.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace wallet::adapters::secondary {

namespace fs = std::filesystem;

std::string DumpDirectoryStorage::filePath(const std::string& dir, const char* fileName) {
    return (fs::path(dir) / fileName).string();
}

// ============================================================================
// WRITE
// ============================================================================

void DumpDirectoryStorage::writeAccounts(const std::string& dir, const std::vector<domain::Account>& accounts) {
    std::string content;
    for (const auto& a : accounts) {
        content += std::to_string(a.id) + ";" + a.phone + ";" + std::to_string(a.balance) + "\n";
    }
    FlatFile::writeAll(filePath(dir, ACCOUNTS_FILE), content);
}

void DumpDirectoryStorage::writePayments(const std::string& dir, const std::vector<domain::Payment>& payments) {
    std::string content;
    for (const auto& p : payments) {
        content += p.id + ";" + std::to_string(p.accountId) + ";" + std::to_string(p.amount) + ";"
                 + p.category + ";" + domain::toString(p.status) + "\n";
    }
    FlatFile::writeAll(filePath(dir, PAYMENTS_FILE), content);
}

void DumpDirectoryStorage::writeFavorites(const std::string& dir, const std::vector<domain::Favorite>& favorites) {
    std::string content;
    for (const auto& f : favorites) {
        content += f.id + ";" + std::to_string(f.accountId) + ";" + std::to_string(f.amount) + ";"
                 + f.category + "\n";
    }
    FlatFile::writeAll(filePath(dir, FAVORITES_FILE), content);
}

// ============================================================================
// READ
// ============================================================================

bool DumpDirectoryStorage::readLines(const std::string& path, std::vector<std::string>& lines) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }

    lines = FlatFile::splitRecords(FlatFile::readAll(path), '\n');
    std::cout << "[DumpDirectoryStorage] Read " << lines.size() << " lines from " << path << std::endl;
    return true;
}

bool DumpDirectoryStorage::readAccounts(const std::string& dir, const Sink<domain::Account>& sink) {
    const auto path = filePath(dir, ACCOUNTS_FILE);
    std::vector<std::string> lines;
    if (!readLines(path, lines)) {
        return false;
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string context = path + ":" + std::to_string(i + 1);
        const auto fields = FlatFile::splitFields(lines[i]);
        FlatFile::requireFields(fields, 3, context);

        domain::Account account;
        account.id = FlatFile::parseInt(fields[0], context);
        account.phone = fields[1];
        account.balance = FlatFile::parseInt(fields[2], context);
        sink(account);
    }
    return true;
}

bool DumpDirectoryStorage::readPayments(const std::string& dir, const Sink<domain::Payment>& sink) {
    const auto path = filePath(dir, PAYMENTS_FILE);
    std::vector<std::string> lines;
    if (!readLines(path, lines)) {
        return false;
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string context = path + ":" + std::to_string(i + 1);
        const auto fields = FlatFile::splitFields(lines[i]);
        FlatFile::requireFields(fields, 5, context);

        domain::Payment payment;
        payment.id = fields[0];
        payment.accountId = FlatFile::parseInt(fields[1], context);
        payment.amount = FlatFile::parseInt(fields[2], context);
        payment.category = fields[3];
        try {
            payment.status = domain::paymentStatusFromString(fields[4]);
        } catch (const std::invalid_argument& e) {
            throw domain::WalletException(domain::ErrorKind::PARSE_ERROR,
                std::string(e.what()) + " in " + context);
        }
        sink(payment);
    }
    return true;
}

bool DumpDirectoryStorage::readFavorites(const std::string& dir, const Sink<domain::Favorite>& sink) {
    const auto path = filePath(dir, FAVORITES_FILE);
    std::vector<std::string> lines;
    if (!readLines(path, lines)) {
        return false;
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string context = path + ":" + std::to_string(i + 1);
        const auto fields = FlatFile::splitFields(lines[i]);
        FlatFile::requireFields(fields, 4, context);

        domain::Favorite favorite;
        favorite.id = fields[0];
        favorite.accountId = FlatFile::parseInt(fields[1], context);
        favorite.amount = FlatFile::parseInt(fields[2], context);
        favorite.category = fields[3];
        sink(favorite);
    }
    return true;
}

} // namespace wallet::adapters::secondary

#include "adapters/secondary/PipeDelimitedAccountFile.hpp"
#include "adapters/secondary/FlatFile.hpp"

#include <iostream>

namespace wallet::adapters::secondary {

std::string PipeDelimitedAccountFile::encode(const std::vector<domain::Account>& accounts) {
    std::string content;
    for (const auto& account : accounts) {
        content += std::to_string(account.id) + ";";
        content += account.phone + ";";
        content += std::to_string(account.balance) + RECORD_TERMINATOR;
    }
    return content;
}

void PipeDelimitedAccountFile::writeAccounts(
    const std::string& path,
    const std::vector<domain::Account>& accounts
) {
    FlatFile::writeAll(path, encode(accounts));
}

void PipeDelimitedAccountFile::readAccounts(const std::string& path, const AccountSink& sink) {
    const auto records = FlatFile::splitRecords(FlatFile::readAll(path), RECORD_TERMINATOR);

    for (size_t i = 0; i < records.size(); ++i) {
        const std::string context = path + " record " + std::to_string(i + 1);
        const auto fields = FlatFile::splitFields(records[i]);
        FlatFile::requireFields(fields, 3, context);

        domain::Account account;
        account.id = FlatFile::parseInt(fields[0], context);
        account.phone = fields[1];
        account.balance = FlatFile::parseInt(fields[2], context);

        sink(account);
    }

    std::cout << "[PipeDelimitedAccountFile] Read " << records.size()
              << " records from " << path << std::endl;
}

} // namespace wallet::adapters::secondary

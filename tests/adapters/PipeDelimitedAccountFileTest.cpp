#include <gtest/gtest.h>

#include "adapters/secondary/PipeDelimitedAccountFile.hpp"
#include "domain/WalletException.hpp"
#include "fixtures/TempDirectory.hpp"

using namespace wallet;
using namespace wallet::tests;
using adapters::secondary::PipeDelimitedAccountFile;

class PipeDelimitedAccountFileTest : public ::testing::Test {
protected:
    std::vector<domain::Account> readAll(const std::string& name) {
        std::vector<domain::Account> result;
        file_.readAccounts(dir_.file(name), [&result](const domain::Account& a) {
            result.push_back(a);
        });
        return result;
    }

    TempDirectory dir_;
    PipeDelimitedAccountFile file_;
};

TEST_F(PipeDelimitedAccountFileTest, Encode_NoNewlineAndTrailingPipe) {
    std::vector<domain::Account> accounts{
        {1, "+992000000001", 0},
        {2, "+992000000002", -15}
    };

    EXPECT_EQ(PipeDelimitedAccountFile::encode(accounts), "1;+992000000001;0|2;+992000000002;-15|");
}

TEST_F(PipeDelimitedAccountFileTest, Encode_Empty) {
    EXPECT_EQ(PipeDelimitedAccountFile::encode({}), "");
}

TEST_F(PipeDelimitedAccountFileTest, WriteAccounts_TruncatesExistingFile) {
    dir_.write("export.txt", "garbage that is much longer than the new content");

    file_.writeAccounts(dir_.file("export.txt"), {{3, "+1", 9}});

    EXPECT_EQ(dir_.read("export.txt"), "3;+1;9|");
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_ParsesAllRecords) {
    dir_.write("export.txt", "1;+992000000001;100|2;+992000000002;0|");

    auto accounts = readAll("export.txt");

    ASSERT_EQ(accounts.size(), 2u);
    EXPECT_EQ(accounts[0].id, 1);
    EXPECT_EQ(accounts[0].phone, "+992000000001");
    EXPECT_EQ(accounts[0].balance, 100);
    EXPECT_EQ(accounts[1].id, 2);
    EXPECT_EQ(accounts[1].balance, 0);
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_EmptyFile_NoRecords) {
    dir_.write("export.txt", "");

    EXPECT_TRUE(readAll("export.txt").empty());
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_SegmentAfterLastPipeIsDropped) {
    dir_.write("export.txt", "1;+992000000001;100|2;+992000000002;5");

    auto accounts = readAll("export.txt");

    ASSERT_EQ(accounts.size(), 1u);
    EXPECT_EQ(accounts[0].id, 1);
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_NonIntegerBalance_ParseError) {
    dir_.write("export.txt", "1;+992000000001;ten|");

    try {
        readAll("export.txt");
        FAIL() << "WalletException expected";
    } catch (const domain::WalletException& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::PARSE_ERROR);
    }
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_TrailingGarbageInId_ParseError) {
    dir_.write("export.txt", "1x;+992000000001;10|");

    EXPECT_THROW(readAll("export.txt"), domain::WalletException);
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_MissingFields_ParseError) {
    dir_.write("export.txt", "1;+992000000001|");

    try {
        readAll("export.txt");
        FAIL() << "WalletException expected";
    } catch (const domain::WalletException& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::PARSE_ERROR);
    }
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_SinkSeesRecordsBeforeFailure) {
    dir_.write("export.txt", "1;a;1|2;b;2|3;c;oops|4;d;4|");

    std::vector<int64_t> seen;
    EXPECT_THROW(
        file_.readAccounts(dir_.file("export.txt"), [&seen](const domain::Account& a) {
            seen.push_back(a.id);
        }),
        domain::WalletException);

    EXPECT_EQ(seen, (std::vector<int64_t>{1, 2}));
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_MissingFile_FileNotFound) {
    try {
        readAll("absent.txt");
        FAIL() << "WalletException expected";
    } catch (const domain::WalletException& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::FILE_NOT_FOUND);
    }
}

TEST_F(PipeDelimitedAccountFileTest, ReadAccounts_PathIsDirectory_FileNotFound) {
    std::filesystem::create_directories(dir_.file("export.txt"));
    int seen = 0;

    try {
        file_.readAccounts(dir_.file("export.txt"), [&seen](const domain::Account&) { ++seen; });
        FAIL() << "WalletException expected";
    } catch (const domain::WalletException& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::FILE_NOT_FOUND);
    }
    EXPECT_EQ(seen, 0);
}

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "sscope/seed_list.hpp"

using sscope::SeedDefaults;
using sscope::SeedList;
using sscope::SeedListResult;

namespace {

const SeedDefaults kDefaults{"admin", "changeme", 8089};

}  // namespace

TEST(SeedList, ParsesRowsAndFillsDefaults) {
    const QString text =
        "# deployment seeds\n"
        "address,port,username,password\n"
        "idx01.example.com,8089,svc,secret\n"
        "\n"
        "sh01.example.com,,,\n"
        "[fd00::5],9089,,\n";
    const SeedListResult result = SeedList::parse(text, kDefaults);
    ASSERT_TRUE(result.success()) << result.errors.join("; ").toStdString();
    ASSERT_EQ(result.seeds.size(), 3);

    EXPECT_EQ(result.seeds.at(0).key.toString(), QString("idx01.example.com:8089"));
    EXPECT_EQ(result.seeds.at(0).username, QString("svc"));
    EXPECT_EQ(result.seeds.at(0).password, QString("secret"));
    EXPECT_EQ(result.seeds.at(0).lineNumber, 3);

    EXPECT_EQ(result.seeds.at(1).key.port, 8089);
    EXPECT_EQ(result.seeds.at(1).username, QString("admin"));
    EXPECT_EQ(result.seeds.at(1).password, QString("changeme"));
    EXPECT_EQ(result.seeds.at(1).lineNumber, 5);

    EXPECT_EQ(result.seeds.at(2).key.address, QString("fd00::5"));
    EXPECT_EQ(result.seeds.at(2).key.port, 9089);
}

TEST(SeedList, HeaderIsCaseInsensitiveAndColumnsMayMove) {
    const SeedListResult result =
        SeedList::parse("Password,ADDRESS,Username,Port\r\npw,cm01,ops,8090\r\n", kDefaults);
    ASSERT_TRUE(result.success());
    ASSERT_EQ(result.seeds.size(), 1);
    EXPECT_EQ(result.seeds.first().key.address, QString("cm01"));
    EXPECT_EQ(result.seeds.first().key.port, 8090);
    EXPECT_EQ(result.seeds.first().username, QString("ops"));
    EXPECT_EQ(result.seeds.first().password, QString("pw"));
}

// Quoted fields keep commas, doubled quotes and line breaks.
TEST(SeedList, QuotedFields) {
    const QString text =
        "address,port,username,password\n"
        "hf01,8089,admin,\"p,a\"\"ss\"\n"
        "hf02,8089,admin,\"two\nlines\"\n"
        "hf03,8089,admin,plain\n";
    const SeedListResult result = SeedList::parse(text, kDefaults);
    ASSERT_TRUE(result.success()) << result.errors.join("; ").toStdString();
    ASSERT_EQ(result.seeds.size(), 3);
    EXPECT_EQ(result.seeds.at(0).password, QString("p,a\"ss"));
    EXPECT_EQ(result.seeds.at(1).password, QString("two\nlines"));
    EXPECT_EQ(result.seeds.at(2).lineNumber, 5);
}

TEST(SeedList, RejectsMissingColumns) {
    const SeedListResult result = SeedList::parse("address,port\nidx01,8089\n", kDefaults);
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.seeds.isEmpty());
    ASSERT_EQ(result.errors.size(), 1);
    EXPECT_TRUE(result.errors.first().contains("username"));
    EXPECT_TRUE(result.errors.first().contains("password"));
}

// One bad row rejects the whole list and every bad row is reported.
TEST(SeedList, RowErrorsRejectWholeList) {
    const QString text =
        "address,port,username,password\n"
        "idx01,8089,admin,pw\n"
        ",8089,admin,pw\n"
        "idx02,99999,admin,pw\n"
        "idx03,8089,admin\n";
    const SeedListResult result = SeedList::parse(text, kDefaults);
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.seeds.isEmpty());
    ASSERT_EQ(result.errors.size(), 3);
    EXPECT_TRUE(result.errors.at(0).startsWith("line 3"));
    EXPECT_TRUE(result.errors.at(1).startsWith("line 4"));
    EXPECT_TRUE(result.errors.at(2).startsWith("line 5"));
}

TEST(SeedList, EmptyListIsAnError) {
    EXPECT_FALSE(SeedList::parse("", kDefaults).success());
    EXPECT_FALSE(SeedList::parse("# nothing here\n", kDefaults).success());
    EXPECT_FALSE(SeedList::parse("address,port,username,password\n", kDefaults).success());
}

TEST(SeedList, UnterminatedQuoteIsAnError) {
    const SeedListResult result =
        SeedList::parse("address,port,username,password\nidx01,8089,admin,\"open\n", kDefaults);
    EXPECT_FALSE(result.success());
    ASSERT_FALSE(result.errors.isEmpty());
    EXPECT_TRUE(result.errors.first().contains("unterminated"));
}

TEST(SeedList, QuoteFieldOnlyWhenNeeded) {
    EXPECT_EQ(SeedList::quoteField("plain"), QString("plain"));
    EXPECT_EQ(SeedList::quoteField("a,b"), QString("\"a,b\""));
    EXPECT_EQ(SeedList::quoteField("say \"hi\""), QString("\"say \"\"hi\"\"\""));
}

TEST(SeedList, LoadFromFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("seeds.csv");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("address,port,username,password\nmc01,8089,,\n");
    file.close();

    const SeedListResult loaded = SeedList::loadFromFile(path, kDefaults);
    ASSERT_TRUE(loaded.success());
    EXPECT_EQ(loaded.path, path);
    ASSERT_EQ(loaded.seeds.size(), 1);
    EXPECT_EQ(loaded.seeds.first().key.address, QString("mc01"));

    const SeedListResult missing = SeedList::loadFromFile(dir.filePath("absent.csv"), kDefaults);
    EXPECT_FALSE(missing.success());
    EXPECT_TRUE(missing.seeds.isEmpty());
}

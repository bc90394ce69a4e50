#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include "telemetry/csv_logger.hpp"

namespace {
  std::vector<std::string> ReadLines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
  }

  struct CsvFixture {
    CsvFixture() { std::remove(path.c_str()); }
    ~CsvFixture() { std::remove(path.c_str()); }
    const std::string path = "bitres_test_requests.csv";
  };
}

BOOST_FIXTURE_TEST_SUITE(csv_logger_tests, CsvFixture)

BOOST_AUTO_TEST_CASE(escape_quotes_fields)
{
  BOOST_CHECK_EQUAL(CsvLogger::Escape("plain"), "\"plain\"");
  BOOST_CHECK_EQUAL(CsvLogger::Escape("say \"no\""), "\"say \"\"no\"\"\"");
  BOOST_CHECK_EQUAL(CsvLogger::Escape("two\nlines"), "\"two lines\"");
}

BOOST_AUTO_TEST_CASE(rows_and_header_written_once)
{
  {
    CsvLogger csv(path);
    RequestRecord mint;
    mint.timestamp = "1700000000";
    mint.request = "mint";
    mint.caller = "0x1111111111111111111111111111111111111111";
    mint.reserve_amount = "1";
    mint.stable_amount = "49750";
    mint.fee = "250";
    csv.LogRequest(mint);

    RequestRecord redeem;
    redeem.timestamp = "1700000060";
    redeem.request = "redeem";
    csv.LogFailure(redeem, "Paused", "redeem is disabled while the engine is paused");
    BOOST_CHECK_EQUAL(csv.RowsWritten(), 2u);
  }
  {
    // reopening appends without a second header
    CsvLogger csv(path);
    RequestRecord poke;
    poke.timestamp = "1700000120";
    poke.request = "poke";
    csv.LogRequest(poke);
  }

  const auto lines = ReadLines(path);
  BOOST_REQUIRE_EQUAL(lines.size(), 4u);
  BOOST_CHECK_EQUAL(lines[0].rfind("Timestamp,Request,Caller,Status", 0), 0u);
  BOOST_CHECK_EQUAL(lines[1], "\"1700000000\",\"mint\",\"0x1111111111111111111111111111111111111111\",\"OK\",1,49750,,,250,,\"\"");
  BOOST_CHECK_NE(lines[2].find("\"Paused\""), std::string::npos);
  BOOST_CHECK_NE(lines[2].find("disabled while the engine is paused"), std::string::npos);
  BOOST_CHECK_NE(lines[3].find("\"poke\""), std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

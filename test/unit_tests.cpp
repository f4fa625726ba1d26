#define THERMITE_IMPLEMENTATION
#include <thermite/thermite.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <array>
#include <cmath>
#include <limits>

TEST_CASE("internal::Parse*()", "[engine]") {
  SECTION("uint64_t") {
    const std::array<std::byte, 8> input = {std::byte(0xef), std::byte(0xcd), std::byte(0xab),
                                            std::byte(0x90), std::byte(0x78), std::byte(0x56),
                                            std::byte(0x34), std::byte(0x12)};
    REQUIRE(thermite::internal::ParseUint64(input.data()) == 0x1234567890abcdefull);
  }

  SECTION("int64_t") {
    std::array<std::byte, 8> input;
    input.fill(std::byte(0xff));
    REQUIRE(thermite::internal::ParseInt64(input.data()) == -1);
  }

  SECTION("double") {
    // 1.5 == 0x3FF8000000000000
    const std::array<std::byte, 8> input = {std::byte(0x00), std::byte(0x00), std::byte(0x00),
                                            std::byte(0x00), std::byte(0x00), std::byte(0x00),
                                            std::byte(0xf8), std::byte(0x3f)};
    REQUIRE(thermite::internal::ParseDouble(input.data()) == 1.5);
  }
}

TEST_CASE("internal::HeaderName()", "[engine]") {
  SECTION("NUL terminated") {
    char field[thermite::HeaderNameLength] = "speed";
    REQUIRE(thermite::internal::HeaderName(field) == "speed");
  }

  SECTION("Full width without terminator") {
    char field[thermite::HeaderNameLength];
    std::memset(field, 'x', sizeof(field));
    REQUIRE(thermite::internal::HeaderName(field) == std::string(48, 'x'));
  }

  SECTION("Bytes after the terminator are ignored") {
    char field[thermite::HeaderNameLength] = {};
    std::memcpy(field, "rpm\0junk", 8);
    REQUIRE(thermite::internal::HeaderName(field) == "rpm");
  }
}

TEST_CASE("internal::IsValidUtf8()", "[engine]") {
  REQUIRE(thermite::internal::IsValidUtf8(""));
  REQUIRE(thermite::internal::IsValidUtf8("battery.voltage"));
  REQUIRE(thermite::internal::IsValidUtf8("temp_\xc2\xb0"
                                          "C"));
  REQUIRE(thermite::internal::IsValidUtf8("\xe2\x82\xac"));
  REQUIRE(thermite::internal::IsValidUtf8("\xf0\x9f\x94\xa5"));
  REQUIRE_FALSE(thermite::internal::IsValidUtf8("\xff"));
  REQUIRE_FALSE(thermite::internal::IsValidUtf8("abc\xc2"));
  REQUIRE_FALSE(thermite::internal::IsValidUtf8("\xc0\xaf"));
  REQUIRE_FALSE(thermite::internal::IsValidUtf8("\xed\xa0\x80"));
}

TEST_CASE("FileEngine::Read*()", "[engine]") {
  SECTION("Header table") {
    Buffer buffer{ExampleLog()};
    uint64_t count = 0;
    requireOk(thermite::FileEngine::ReadFileHeader(buffer, &count));
    REQUIRE(count == 3);

    std::vector<thermite::RawHeader> headers(count);
    requireOk(thermite::FileEngine::ReadHeaders(buffer, count, headers.data()));
    REQUIRE(thermite::internal::HeaderName(headers[0].name) == "A");
    REQUIRE(thermite::internal::HeaderName(headers[1].name) == "B");
    REQUIRE(thermite::internal::HeaderName(headers[2].name) == "empty");
    REQUIRE(headers[0].start == 16 + 56 * 3);
    REQUIRE(headers[1].start == headers[0].start + 8 + 16 * 2);
    REQUIRE(headers[2].start == headers[1].start + 8 + 16);
  }

  SECTION("Data block") {
    Buffer buffer{ExampleLog()};
    thermite::ByteOffset start = 0;
    requireOk(thermite::FileEngine::FindSignal(buffer, "A", &start));
    uint64_t count = 0;
    requireOk(thermite::FileEngine::ReadBlockCount(buffer, start, &count));
    REQUIRE(count == 2);

    std::vector<thermite::RawSample> samples(count);
    requireOk(thermite::FileEngine::ReadBlock(buffer, start, count, samples.data()));
    REQUIRE(samples[0].timestamp == 0);
    REQUIRE(samples[0].value == 1.0);
    REQUIRE(samples[1].timestamp == 2'000'000);
    REQUIRE(samples[1].value == 2.0);
  }

  SECTION("Negative timestamps and special values") {
    Buffer buffer{LogBuilder{}.add("x", {{-5, -0.25}, {-1, 1e300}}).build()};
    thermite::ByteOffset start = 0;
    requireOk(thermite::FileEngine::FindSignal(buffer, "x", &start));
    std::vector<thermite::RawSample> samples(2);
    requireOk(thermite::FileEngine::ReadBlock(buffer, start, 2, samples.data()));
    REQUIRE(samples[0].timestamp == -5);
    REQUIRE(samples[0].value == -0.25);
    REQUIRE(samples[1].timestamp == -1);
    REQUIRE(samples[1].value == 1e300);
  }

  SECTION("File too small") {
    Buffer buffer{Bytes(10)};
    uint64_t count = 0;
    REQUIRE(thermite::FileEngine::ReadFileHeader(buffer, &count).code ==
            thermite::StatusCode::FileTooSmall);
  }

  SECTION("Magic mismatch") {
    auto bytes = ExampleLog();
    bytes[1] = std::byte('X');
    Buffer buffer{bytes};
    uint64_t count = 0;
    const auto status = thermite::FileEngine::ReadFileHeader(buffer, &count);
    REQUIRE(status.code == thermite::StatusCode::MagicMismatch);
    REQUIRE(status.message == "invalid magic bytes: 0x895848524D300D0A");
  }

  SECTION("Header count overruns the file") {
    auto bytes = LogBuilder{}.add("A", {{0, 1.0}}).build();
    bytes[8] = std::byte(100);
    Buffer buffer{bytes};
    uint64_t count = 0;
    REQUIRE(thermite::FileEngine::ReadFileHeader(buffer, &count).code ==
            thermite::StatusCode::InvalidHeader);
  }

  SECTION("Data block offset past the end of the file") {
    Buffer buffer{LogBuilder{}.addDangling("A", 1'000'000).build()};
    thermite::ByteOffset start = 0;
    requireOk(thermite::FileEngine::FindSignal(buffer, "A", &start));
    uint64_t count = 0;
    REQUIRE(thermite::FileEngine::ReadBlockCount(buffer, start, &count).code ==
            thermite::StatusCode::InvalidDataBlock);
  }

  SECTION("Sample count overruns the file") {
    auto bytes = LogBuilder{}.add("A", {{0, 1.0}}).build();
    // Sample count of the only block follows the 72-byte header area
    bytes[16 + 56] = std::byte(2);
    Buffer buffer{bytes};
    uint64_t count = 0;
    REQUIRE(thermite::FileEngine::ReadBlockCount(buffer, 16 + 56, &count).code ==
            thermite::StatusCode::InvalidDataBlock);
  }

  SECTION("Unknown signal") {
    Buffer buffer{ExampleLog()};
    thermite::ByteOffset start = 0;
    REQUIRE(thermite::FileEngine::FindSignal(buffer, "missing", &start).code ==
            thermite::StatusCode::SignalNotFound);
  }

  SECTION("Duplicate names resolve to the first header") {
    Buffer buffer{LogBuilder{}.add("dup", {{1, 1.0}}).add("dup", {{2, 2.0}, {3, 3.0}}).build()};
    thermite::ByteOffset start = 0;
    requireOk(thermite::FileEngine::FindSignal(buffer, "dup", &start));
    uint64_t count = 0;
    requireOk(thermite::FileEngine::ReadBlockCount(buffer, start, &count));
    REQUIRE(count == 1);
  }
}

TEST_CASE("FileEngine", "[engine]") {
  TempFile file{ExampleLog()};
  std::vector<thermite::Status> problems;
  thermite::FileEngine engine{[&](const thermite::Status& problem) {
    problems.push_back(problem);
  }};

  SECTION("headerCount() and headers()") {
    REQUIRE(engine.headerCount(file.path) == 3);

    std::vector<thermite::RawHeader> headers(3);
    REQUIRE(engine.headers(file.path, headers.data(), 3) == 3);
    REQUIRE(thermite::internal::HeaderName(headers[1].name) == "B");

    // Asking for fewer entries populates only that many
    std::vector<thermite::RawHeader> first(1);
    REQUIRE(engine.headers(file.path, first.data(), 1) == 1);
    REQUIRE(thermite::internal::HeaderName(first[0].name) == "A");

    // Asking for more populates what exists
    std::vector<thermite::RawHeader> extra(5);
    REQUIRE(engine.headers(file.path, extra.data(), 5) == 3);
    REQUIRE(problems.empty());
  }

  SECTION("dataCount() and data()") {
    REQUIRE(engine.dataCount(file.path, "A") == 2);
    REQUIRE(engine.dataCount(file.path, "empty") == 0);

    std::vector<thermite::RawSample> samples(2);
    REQUIRE(engine.data(file.path, "A", samples.data(), 2) == 2);
    REQUIRE(samples[1].timestamp == 2'000'000);
    REQUIRE(samples[1].value == 2.0);
    REQUIRE(engine.data(file.path, "empty", nullptr, 0) == 0);
    REQUIRE(problems.empty());
  }

  SECTION("Unknown signal") {
    REQUIRE(engine.dataCount(file.path, "missing") ==
            int64_t(thermite::EngineCode::SignalNotFound));
    REQUIRE(problems.size() == 1);
    REQUIRE(problems[0].code == thermite::StatusCode::SignalNotFound);
  }

  SECTION("Missing file") {
    const auto missing = file.path + ".missing";
    REQUIRE(engine.headerCount(missing) == int64_t(thermite::EngineCode::OpenFailed));
    REQUIRE(engine.dataCount(missing, "A") == int64_t(thermite::EngineCode::OpenFailed));
    REQUIRE(problems.size() == 2);
    REQUIRE(problems[0].code == thermite::StatusCode::OpenFailed);
    REQUIRE(problems[0].message.find(missing) != std::string::npos);
  }

  SECTION("Null output buffer") {
    REQUIRE(engine.headers(file.path, nullptr, 1) ==
            int64_t(thermite::EngineCode::InvalidArgument));
    REQUIRE(engine.data(file.path, "A", nullptr, 1) ==
            int64_t(thermite::EngineCode::InvalidArgument));
  }

  SECTION("Not a thermite file") {
    TempFile other{Bytes(64, std::byte('z'))};
    REQUIRE(engine.headerCount(other.path) == int64_t(thermite::EngineCode::MagicMismatch));
  }
}

TEST_CASE("EngineCodeString()", "[engine]") {
  REQUIRE(thermite::EngineCodeString(-1) == "open failed");
  REQUIRE(thermite::EngineCodeString(-5) == "invalid data block");
  REQUIRE(thermite::EngineCodeString(-42) == "unknown");
  REQUIRE(thermite::EngineCodeString(3) == "ok");
}

TEST_CASE("ThermiteReader::open()", "[reader]") {
  SECTION("Header order is file order") {
    FakeEngine engine{LogBuilder{}
                        .add("zeta", {{0, 0.0}})
                        .add("alpha", {{0, 0.0}})
                        .add("mid", {{0, 0.0}})
                        .build()};
    thermite::ThermiteReader reader{engine};
    requireOk(reader.open("log.thermite"));

    REQUIRE(reader.isOpen());
    REQUIRE(reader.path() == "log.thermite");
    REQUIRE(reader.signalNames() == std::vector<std::string>{"zeta", "alpha", "mid"});
    REQUIRE(reader.headers().size() == 3);
    REQUIRE(reader.headers()[2].name == "mid");
    REQUIRE(engine.headerCountCalls == 1);
    REQUIRE(engine.headersCalls == 1);
    REQUIRE(engine.dataCountCalls == 0);
  }

  SECTION("contains()") {
    FakeEngine engine{ExampleLog()};
    thermite::ThermiteReader reader{engine};
    requireOk(reader.open("log.thermite"));

    REQUIRE(reader.contains("A"));
    REQUIRE(reader.contains("empty"));
    REQUIRE_FALSE(reader.contains("a"));
    REQUIRE_FALSE(reader.contains("nonexistent"));
  }

  SECTION("Full-width names") {
    const std::string longName(48, 'n');
    FakeEngine engine{LogBuilder{}.add(longName, {{0, 1.0}}).build()};
    thermite::ThermiteReader reader{engine};
    requireOk(reader.open("log.thermite"));
    REQUIRE(reader.contains(longName));

    thermite::SignalPtr signal;
    requireOk(reader.readSignal(longName, &signal));
    REQUIRE(signal->size() == 1);
  }

  SECTION("Header count failure") {
    FakeEngine engine{ExampleLog()};
    engine.headerCountError = int64_t(thermite::EngineCode::MagicMismatch);
    thermite::ThermiteReader reader{engine};
    const auto status = reader.open("bad.thermite");

    REQUIRE(status.code == thermite::StatusCode::HeaderCountFailed);
    REQUIRE(status.engineCode == -3);
    REQUIRE(status.message.find("bad.thermite") != std::string::npos);
    REQUIRE(engine.headersCalls == 0);
    REQUIRE_FALSE(reader.isOpen());
    REQUIRE(reader.headers().empty());
  }

  SECTION("Header populate failure") {
    FakeEngine engine{ExampleLog()};
    engine.headersError = int64_t(thermite::EngineCode::ReadFailed);
    thermite::ThermiteReader reader{engine};
    const auto status = reader.open("bad.thermite");

    REQUIRE(status.code == thermite::StatusCode::HeadersFailed);
    REQUIRE(status.engineCode == -2);
    REQUIRE_FALSE(reader.isOpen());
    REQUIRE(reader.signalNames().empty());
  }

  SECTION("A failed open leaves no catalog from an earlier file") {
    FakeEngine engine{ExampleLog()};
    thermite::ThermiteReader reader{engine};
    requireOk(reader.open("good.thermite"));
    REQUIRE(reader.contains("A"));

    engine.headerCountError = int64_t(thermite::EngineCode::OpenFailed);
    REQUIRE_FALSE(reader.open("gone.thermite").ok());
    REQUIRE_FALSE(reader.isOpen());
    REQUIRE_FALSE(reader.contains("A"));
    REQUIRE(reader.path().empty());
  }

  SECTION("Queries on a closed reader") {
    FakeEngine engine{ExampleLog()};
    thermite::ThermiteReader reader{engine};

    thermite::SignalPtr signal;
    REQUIRE(reader.readSignal("A", &signal).code == thermite::StatusCode::NotOpen);
    REQUIRE(signal == nullptr);

    thermite::AlignedTable table;
    REQUIRE(reader.buildTable({"A"}, {}, &table).code == thermite::StatusCode::NotOpen);

    requireOk(reader.open("log.thermite"));
    reader.close();
    REQUIRE(reader.readSignal("A", &signal).code == thermite::StatusCode::NotOpen);
    REQUIRE(engine.dataCountCalls == 0);

    REQUIRE(reader.headers().empty());
    REQUIRE(reader.signalNames().empty());
    REQUIRE_FALSE(reader.contains("A"));
  }

  SECTION("Duplicate names are reported and kept") {
    FakeEngine engine{LogBuilder{}.add("dup", {{1, 1.0}}).add("dup", {{2, 2.0}}).build()};
    std::vector<thermite::Status> problems;
    thermite::ThermiteReaderOptions options;
    options.onProblem = [&](const thermite::Status& problem) {
      problems.push_back(problem);
    };
    thermite::ThermiteReader reader{engine};
    requireOk(reader.open("log.thermite", options));

    REQUIRE(reader.signalNames() == std::vector<std::string>{"dup", "dup"});
    REQUIRE(problems.size() == 1);
    REQUIRE(problems[0].code == thermite::StatusCode::DuplicateSignal);

    thermite::SignalPtr signal;
    requireOk(reader.readSignal("dup", &signal));
    REQUIRE(signal->samples == std::vector<thermite::Sample>{{1, 1.0}});
  }

  SECTION("Names that are not UTF-8") {
    const std::string badName = "bad\xff";
    FakeEngine engine{LogBuilder{}.add(badName, {{0, 1.0}}).add("good", {{0, 2.0}}).build()};

    std::vector<thermite::Status> problems;
    thermite::ThermiteReaderOptions options;
    options.onProblem = [&](const thermite::Status& problem) {
      problems.push_back(problem);
    };

    thermite::ThermiteReader lenient{engine};
    requireOk(lenient.open("log.thermite", options));
    REQUIRE(lenient.contains(badName));
    REQUIRE(problems.size() == 1);
    REQUIRE(problems[0].code == thermite::StatusCode::InvalidSignalName);

    options.nameDecoding = thermite::NameDecoding::Strict;
    thermite::ThermiteReader strict{engine};
    REQUIRE(strict.open("log.thermite", options).code == thermite::StatusCode::InvalidSignalName);
    REQUIRE_FALSE(strict.isOpen());
  }

  SECTION("FileEngine by default") {
    TempFile file{ExampleLog()};
    thermite::ThermiteReader reader;
    requireOk(reader.open(file.path));
    REQUIRE(reader.signalNames() == std::vector<std::string>{"A", "B", "empty"});

    thermite::SignalPtr signal;
    requireOk(reader.readSignal("B", &signal));
    REQUIRE(signal->known);
    REQUIRE(signal->samples == std::vector<thermite::Sample>{{1'000'000, 9.0}});

    thermite::ThermiteReader missing;
    const auto status = missing.open(file.path + ".missing");
    REQUIRE(status.code == thermite::StatusCode::HeaderCountFailed);
    REQUIRE(status.engineCode == int64_t(thermite::EngineCode::OpenFailed));
  }
}

TEST_CASE("ThermiteReader::readSignal()", "[reader][cache]") {
  FakeEngine engine{ExampleLog()};
  thermite::ThermiteReader reader{engine};
  requireOk(reader.open("log.thermite"));

  SECTION("Samples are returned verbatim") {
    thermite::SignalPtr signal;
    requireOk(reader.readSignal("A", &signal));
    REQUIRE(signal->name == "A");
    REQUIRE(signal->known);
    REQUIRE(signal->samples == std::vector<thermite::Sample>{{0, 1.0}, {2'000'000, 2.0}});
  }

  SECTION("Unsorted samples are not reordered") {
    FakeEngine unsorted{LogBuilder{}.add("u", {{30, 3.0}, {10, 1.0}, {10, 1.5}}).build()};
    thermite::ThermiteReader other{unsorted};
    requireOk(other.open("log.thermite"));
    thermite::SignalPtr signal;
    requireOk(other.readSignal("u", &signal));
    REQUIRE(signal->samples == std::vector<thermite::Sample>{{30, 3.0}, {10, 1.0}, {10, 1.5}});
  }

  SECTION("NaN samples are kept") {
    FakeEngine gaps{
      LogBuilder{}.add("g", {{0, std::numeric_limits<double>::quiet_NaN()}, {10, 1.0}}).build()};
    thermite::ThermiteReader other{gaps};
    requireOk(other.open("log.thermite"));
    thermite::SignalPtr signal;
    requireOk(other.readSignal("g", &signal));
    REQUIRE(signal->size() == 2);
    REQUIRE(std::isnan(signal->samples[0].value));
    REQUIRE(signal->samples[1] == thermite::Sample{10, 1.0});
  }

  SECTION("Repeated reads return the cached signal") {
    thermite::SignalPtr first;
    thermite::SignalPtr second;
    requireOk(reader.readSignal("A", &first));
    requireOk(reader.readSignal("A", &second));

    REQUIRE(first == second);
    REQUIRE(engine.dataCountCalls == 1);
    REQUIRE(engine.dataCalls == 1);
    REQUIRE(reader.cachedSignalCount() == 1);
  }

  SECTION("clearCache() forces a new engine query") {
    thermite::SignalPtr first;
    requireOk(reader.readSignal("A", &first));
    reader.clearCache();
    REQUIRE(reader.cachedSignalCount() == 0);

    thermite::SignalPtr second;
    requireOk(reader.readSignal("A", &second));
    REQUIRE(engine.dataCountCalls == 2);
    REQUIRE(engine.dataCalls == 2);
    REQUIRE(first != second);
    REQUIRE(first->samples == second->samples);
  }

  SECTION("Unknown names are empty and never reach the engine") {
    thermite::SignalPtr signal;
    requireOk(reader.readSignal("nonexistent", &signal));
    REQUIRE_FALSE(signal->known);
    REQUIRE(signal->empty());
    REQUIRE(engine.dataCountCalls == 0);
    REQUIRE(engine.dataCalls == 0);

    // The empty result is cached as well
    thermite::SignalPtr again;
    requireOk(reader.readSignal("nonexistent", &again));
    REQUIRE(again == signal);
    REQUIRE(reader.cachedSignalCount() == 1);
  }

  SECTION("Known signal with no samples") {
    thermite::SignalPtr signal;
    requireOk(reader.readSignal("empty", &signal));
    REQUIRE(signal->known);
    REQUIRE(signal->empty());
    REQUIRE(engine.dataCountCalls == 1);
  }

  SECTION("Data count failure") {
    engine.dataCountError = int64_t(thermite::EngineCode::InvalidDataBlock);
    thermite::SignalPtr signal;
    const auto status = reader.readSignal("A", &signal);
    REQUIRE(status.code == thermite::StatusCode::DataCountFailed);
    REQUIRE(status.engineCode == -5);
    REQUIRE(status.message.find("\"A\"") != std::string::npos);
    REQUIRE(status.message.find("log.thermite") != std::string::npos);
    REQUIRE(signal == nullptr);
    REQUIRE(engine.dataCalls == 0);
  }

  SECTION("Data populate failure") {
    engine.dataError = int64_t(thermite::EngineCode::ReadFailed);
    thermite::SignalPtr signal;
    const auto status = reader.readSignal("A", &signal);
    REQUIRE(status.code == thermite::StatusCode::DataFailed);
    REQUIRE(status.engineCode == -2);
    REQUIRE(signal == nullptr);
  }

  SECTION("Failures are not cached and do not affect other signals") {
    engine.dataError = int64_t(thermite::EngineCode::InvalidDataBlock);
    engine.failingSignal = "A";

    thermite::SignalPtr b;
    requireOk(reader.readSignal("B", &b));

    thermite::SignalPtr a;
    REQUIRE(reader.readSignal("A", &a).code == thermite::StatusCode::DataFailed);
    REQUIRE(reader.cachedSignalCount() == 1);

    // Once the engine recovers the signal is read again rather than served stale
    engine.dataError.reset();
    requireOk(reader.readSignal("A", &a));
    REQUIRE(a->size() == 2);
    REQUIRE(engine.dataCalls == 3);

    thermite::SignalPtr bAgain;
    requireOk(reader.readSignal("B", &bAgain));
    REQUIRE(bAgain == b);
  }

  SECTION("Readers do not share caches") {
    thermite::ThermiteReader other{engine};
    requireOk(other.open("log.thermite"));

    thermite::SignalPtr first;
    thermite::SignalPtr second;
    requireOk(reader.readSignal("B", &first));
    requireOk(other.readSignal("B", &second));
    REQUIRE(first != second);
    REQUIRE(engine.dataCalls == 2);
  }
}

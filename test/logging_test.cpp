#include <cstdio>
#include <fstream>
#include <string>
#include <type_traits>
#include <vector>

#include "gtest/gtest.h"

#include "sfengine.hpp"
#include "sflogging.hpp"
#include "sfmachine.hpp"
#include "sfworkers.hpp"

namespace sfib {
namespace {

using log_buffer = logging::_buffer<true>;
using silent_buffer = logging::_buffer<false>;

static_assert(std::is_same<logging::buffer, log_buffer>::value,
              "event log tests are built with SFIB_ENABLE_LOGGING");

std::vector<std::string> read_lines(const std::string& fname) {
  std::ifstream in(fname);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

class LoggingTest : public ::testing::Test {
protected:
  void SetUp() override {
    log_buffer::init();
    log_buffer::clear();
  }

  void TearDown() override {
    log_buffer::clear();
  }

  std::size_t nb_buffered(logging::event_tag_type tag) {
    std::size_t n = 0;
    log_buffer::buf.iterate([&] (std::vector<logging::event_type>& b) {
      for (auto& e : b) {
        if (e.tag == tag) {
          n++;
        }
      }
    });
    return n;
  }

  std::size_t nb_buffered() {
    std::size_t n = 0;
    log_buffer::buf.iterate([&] (std::vector<logging::event_type>& b) {
      n += b.size();
    });
    return n;
  }
};

TEST_F(LoggingTest, PushAppendsToWorkerBuffer) {
  log_buffer::push_cache_fill(7);
  log_buffer::push_chunk_run(0, 10, 1.5);
  EXPECT_EQ(2u, nb_buffered());
  log_buffer::clear();
  EXPECT_EQ(0u, nb_buffered());
}

TEST_F(LoggingTest, DisabledBufferIgnoresPushes) {
  silent_buffer::push_cache_fill(7);
  silent_buffer::push_range_run(0, 10, 1, 2.0);
  std::size_t n = 0;
  silent_buffer::buf.iterate([&] (std::vector<logging::event_type>& b) {
    n += b.size();
  });
  EXPECT_EQ(0u, n);
}

TEST_F(LoggingTest, OutputWritesOneLinePerEventInOrder) {
  log_buffer::push_cache_fill(7);
  log_buffer::push_chunk_run(20, 30, 1.5);
  log_buffer::push_range_run(20, 41, 3, 12.25);
  std::string fname = ::testing::TempDir() + "sfib_logging_test.txt";
  log_buffer::output(fname);
  std::vector<std::string> lines = read_lines(fname);
  ASSERT_EQ(3u, lines.size());
  EXPECT_NE(std::string::npos, lines[0].find("\tcache_fill\t7"));
  EXPECT_NE(std::string::npos, lines[1].find("\tchunk_run\t20\t30\t1.500000"));
  EXPECT_NE(std::string::npos, lines[2].find("\trange_run\t20\t41\t3\t12.250000"));
  std::remove(fname.c_str());
}

TEST_F(LoggingTest, EmptyFileNameWritesNothing) {
  log_buffer::push_cache_fill(1);
  log_buffer::output("");
  EXPECT_EQ(1u, nb_buffered());
}

TEST_F(LoggingTest, LargeWorkerRequestStaysWithinPerWorkerCapacity) {
  machine::set_nb_proc(200);
  EXPECT_EQ(machine::max_nb_proc, machine::nb_proc());
  index_type nb_chunks = workers::range::chunked_for(0, 20000, 1, [] (index_type, index_type) { });
  EXPECT_EQ(20000u, nb_chunks);
  EXPECT_EQ(20000u, nb_buffered(logging::chunk_run));
  EXPECT_LE(perworker::id_counter().load(), perworker::default_max_nb_workers);
}

TEST_F(LoggingTest, RangePastLimitRunsOnlyChunksBelowIt) {
  machine::set_nb_proc(4);
  engine e(strain::hybrid);
  e.compute_range_concurrently(0, 1000000000000ull);
  EXPECT_EQ(19u, nb_buffered(logging::chunk_run));
  // racing chunks may fill the same index twice
  EXPECT_GE(nb_buffered(logging::cache_fill), 185u);
  std::string fname = ::testing::TempDir() + "sfib_range_log_test.txt";
  log_buffer::output(fname);
  std::vector<std::string> lines = read_lines(fname);
  std::size_t nb_range_runs = 0;
  for (auto& line : lines) {
    if (line.find("\trange_run\t0\t1000000000000\t19\t") != std::string::npos) {
      nb_range_runs++;
    }
  }
  EXPECT_EQ(1u, nb_range_runs);
  std::remove(fname.c_str());
}

} // namespace
} // namespace sfib

#ifndef TRANSCODE_BENCH_VERSION_HPP
#define TRANSCODE_BENCH_VERSION_HPP

namespace transcode_bench {

#ifndef TRANSCODE_BENCH_VERSION
#define TRANSCODE_BENCH_VERSION "1.0.0"
#endif

constexpr const char* VERSION = TRANSCODE_BENCH_VERSION;
constexpr const char* PROGRAM_NAME = "transcode-benchmark";

} // namespace transcode_bench

#endif // TRANSCODE_BENCH_VERSION_HPP

/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#ifndef _WIN32
#   include <sys/resource.h>
#endif
#include <chrono>
#include <iostream>
#include <gstate/common/logger.hpp>
#include <gstate/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace gstate;
    const auto start = std::chrono::steady_clock::now();
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
#   ifndef _WIN32
    {
        static constexpr size_t stack_size = 32ULL << 20U;
        struct rlimit rl;
        if (getrlimit(RLIMIT_STACK, &rl) != 0) [[unlikely]]
            throw error_sys("getrlimit RLIMIT_STACK failed!");
        if (rl.rlim_cur < stack_size) {
            rl.rlim_cur = stack_size;
            if (setrlimit(RLIMIT_STACK, &rl) != 0) [[unlikely]]
                throw error_sys("setrlimit RLIMIT_STACK failed!");
        }
    }
#   endif
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    const std::chrono::duration<double> took = std::chrono::steady_clock::now() - start;
    logger::info("run-test: finished in {:.3f} sec", took.count());
    return res ? 1 : 0;
}

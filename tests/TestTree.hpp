#pragma once
#include <gtest/gtest.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// Fixture with a private scratch directory and a logger whose lines can be inspected
class TestTree : public ::testing::Test {
protected:
    fs::path scratch;
    std::ostringstream logLines;
    std::shared_ptr<spdlog::logger> logger;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        scratch = fs::temp_directory_path() / ("dirmirror_" + std::string(info->test_suite_name()) + "_" +
                                               info->name() + "_" + std::to_string(::getpid()));
        fs::remove_all(scratch);
        fs::create_directories(scratch);

        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(logLines);
        logger = std::make_shared<spdlog::logger>("test", sink);
        logger->set_pattern("%v");
        logger->set_level(spdlog::level::debug);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(scratch, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(scratch, ec);
    }

    static void writeFile(const fs::path& p, const std::string& content) {
        fs::create_directories(p.parent_path());
        std::ofstream o(p, std::ios::binary | std::ios::trunc);
        o << content;
    }

    static std::string readFile(const fs::path& p) {
        std::ifstream i(p, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(i)), {});
    }

    // relative paths of every entry under root, directories with a trailing '/'
    static std::set<std::string> listTree(const fs::path& root) {
        std::set<std::string> out;
        for (const auto& e : fs::recursive_directory_iterator(root)) {
            std::string rel = e.path().lexically_relative(root).generic_string();
            if (e.is_directory() && !e.is_symlink()) rel += "/";
            out.insert(rel);
        }
        return out;
    }

    std::string log() const { return logLines.str(); }

    static bool runningAsRoot() { return ::geteuid() == 0; }
};

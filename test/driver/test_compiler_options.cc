//
// Tests for command-line parsing
//

#include <doctest/doctest.h>
#include "compiler_options.hh"
#include <stdexcept>
#include <string>
#include <vector>

using namespace schemagen;
using namespace schemagen::driver;

namespace {
    CompilerOptions parse(std::vector<std::string> args) {
        args.insert(args.begin(), "sgc");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return parse_command_line(static_cast<int>(args.size()), argv.data());
    }
}

TEST_SUITE("Driver - Compiler Options") {

    TEST_CASE("Defaults") {
        auto opts = parse({"user.json"});

        REQUIRE(opts.input_files.size() == 1);
        CHECK(opts.input_files[0] == "user.json");
        CHECK(opts.output_dir.empty());
        CHECK(opts.template_dir == SCHEMAGEN_DEFAULT_TEMPLATE_DIR);
        CHECK(opts.target_language == "scala");
        CHECK(opts.generator_options.empty());
        CHECK_FALSE(opts.verbose);
        CHECK_FALSE(opts.quiet);
        CHECK_FALSE(opts.debug);
        CHECK(opts.output_mode == OutputMode::Compile);
        CHECK_FALSE(opts.flat_output);
    }

    TEST_CASE("Several input files keep their order") {
        auto opts = parse({"b.json", "a.json", "c.json"});
        REQUIRE(opts.input_files.size() == 3);
        CHECK(opts.input_files[0] == "b.json");
        CHECK(opts.input_files[2] == "c.json");
    }

    TEST_CASE("Output and template directories") {
        SUBCASE("Separate arguments") {
            auto opts = parse({"-o", "out", "-T", "tpl", "user.json"});
            CHECK(opts.output_dir == "out");
            CHECK(opts.template_dir == "tpl");
        }

        SUBCASE("Glued arguments") {
            auto opts = parse({"-oout", "-Ttpl", "user.json"});
            CHECK(opts.output_dir == "out");
            CHECK(opts.template_dir == "tpl");
        }

        SUBCASE("Long template option") {
            CHECK(parse({"--templates", "a", "user.json"}).template_dir == "a");
            CHECK(parse({"--templates=b", "user.json"}).template_dir == "b");
        }

        SUBCASE("Missing values") {
            CHECK_THROWS_AS(parse({"user.json", "-o"}), std::runtime_error);
            CHECK_THROWS_AS(parse({"user.json", "--templates"}), std::runtime_error);
            CHECK_THROWS_AS(parse({"--templates=", "user.json"}), std::runtime_error);
        }
    }

    TEST_CASE("Diagnostics and output mode flags") {
        auto opts = parse({"-v", "--debug", "--flat-output", "--print-outputs", "user.json"});
        CHECK(opts.verbose);
        CHECK(opts.debug);
        CHECK(opts.flat_output);
        CHECK(opts.output_mode == OutputMode::PrintOutputs);

        CHECK(parse({"--quiet", "user.json"}).quiet);
        CHECK(parse({"--verbose", "user.json"}).verbose);
    }

    TEST_CASE("Quiet conflicts with verbose and debug") {
        CHECK_THROWS_AS(parse({"-q", "-v", "user.json"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"-q", "--debug", "user.json"}), std::runtime_error);
    }

    TEST_CASE("Target language") {
        CHECK(parse({"-t", "scala", "user.json"}).target_language == "scala");
        CHECK(parse({"-tScala", "user.json"}).target_language == "Scala");
        CHECK_THROWS_AS(parse({"-t", "cobol", "user.json"}), std::runtime_error);
    }

    TEST_CASE("Generator options") {
        auto opts = parse({"--scala-finagle-client=true", "--scala-ostrich-server=off", "user.json"});

        REQUIRE(opts.generator_options.size() == 2);
        CHECK(std::get<bool>(opts.generator_options.at("finagle-client")));
        CHECK_FALSE(std::get<bool>(opts.generator_options.at("ostrich-server")));

        CHECK(std::get<bool>(parse({"--scala-finagle-service=yes", "x.json"})
                                 .generator_options.at("finagle-service")));
    }

    TEST_CASE("Invalid generator options") {
        CHECK_THROWS_AS(parse({"--scala-finagle-client=maybe", "user.json"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"--scala-thrift-server=true", "user.json"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"--cobol-thing=1", "user.json"}), std::runtime_error);
    }

    TEST_CASE("Unknown options and missing inputs") {
        CHECK_THROWS_AS(parse({"--frobnicate", "user.json"}), std::runtime_error);
        CHECK_THROWS_AS(parse({}), std::runtime_error);
        CHECK_THROWS_AS(parse({"-v"}), std::runtime_error);
    }
}

//
// Tests for the on-disk fragment loader
//

#include <doctest/doctest.h>
#include "directory_fragment_loader.hh"
#include <schemagen/codegen.hh>
#include <schemagen/codegen/template/fragment_registry.hh>
#include <filesystem>
#include <fstream>

using namespace schemagen;
using namespace schemagen::driver;

namespace {
    struct TempTemplates {
        std::filesystem::path root;

        TempTemplates()
            : root(std::filesystem::temp_directory_path() / "schemagen_fragment_loader_test") {
            std::filesystem::remove_all(root);
            std::filesystem::create_directories(root / "scala");
        }

        ~TempTemplates() {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        void write(const std::string& relative, const std::string& content) const {
            std::ofstream out(root / relative, std::ios::binary);
            out << content;
        }
    };
}

TEST_SUITE("Driver - Directory Fragment Loader") {

    TEST_CASE("Paths are root/prefix/name.mustache") {
        DirectoryFragmentLoader loader("templates");
        CHECK(loader.root() == "templates");
        CHECK(loader.path_for("scala/", "enum") == std::filesystem::path("templates") / "scala/enum.mustache");
    }

    TEST_CASE("Fragments are read verbatim") {
        TempTemplates dir;
        dir.write("scala/enum.mustache", "object {{enum_name}}\r\n\tline two\n");

        DirectoryFragmentLoader loader(dir.root);
        CHECK(loader.load("scala/", "enum") == "object {{enum_name}}\r\n\tline two\n");
    }

    TEST_CASE("Missing fragments are reported by prefixed name") {
        TempTemplates dir;
        DirectoryFragmentLoader loader(dir.root);

        try {
            (void)loader.load("scala/", "service");
            FAIL("expected fragment_not_found_error");
        } catch (const codegen::fragment_not_found_error& e) {
            CHECK(e.fragment_name() == "scala/service");
        }
    }

    TEST_CASE("Directories are not fragments") {
        TempTemplates dir;
        std::filesystem::create_directories(dir.root / "scala" / "struct.mustache");

        DirectoryFragmentLoader loader(dir.root);
        CHECK_THROWS_AS((void)loader.load("scala/", "struct"), codegen::fragment_not_found_error);
    }

    TEST_CASE("Registries load through the directory loader") {
        TempTemplates dir;
        dir.write("scala/header.mustache", "package {{pkg}}\n");

        DirectoryFragmentLoader loader(dir.root);
        codegen::FragmentRegistry registry(loader, "scala/", {"header"});
        CHECK(registry.get("header")->render({{"pkg", "com.example"}}) == "package com.example\n");
    }
}

#include <doctest/doctest.h>
#include <cdd/coverage.hpp>

#include "../test_helpers.hpp"

TEST_CASE("coverage counts linked tests per requirement") {
    cdd::testing::TempDir dir;
    dir.write("contracts/project.yaml", "project: demo\nrequirements:\n  - id: P-1\n");
    dir.write("contracts/a.yaml",
              "contract: a\n"
              "requirements:\n"
              "  - id: R-2\n"
              "  - id: R-1\n"
              "tests:\n"
              "  - id: T1\n"
              "    requirement: R-1\n"
              "  - id: T2\n"
              "    requirement: R-1\n"
              "  - id: T3\n"
              "    requirement: R-9\n");
    dir.write("contracts/sub/b.yaml",
              "contract: b\n"
              "requirements:\n"
              "  - id: R-3\n"
              "tests:\n"
              "  - id: T1\n"
              "    requirement: R-2\n");
    dir.write("contracts/broken.yaml", "tests: [\n");

    auto report = cdd::compute_coverage(dir.path() + "/contracts");

    REQUIRE(report.requirements.size() == 3);
    CHECK(report.total_count == 3);
    CHECK(report.requirements[0].id == "R-1");
    CHECK(report.requirements[0].linked_tests == 2);
    CHECK(report.requirements[1].id == "R-2");
    CHECK(report.requirements[1].linked_tests == 1);
    CHECK(report.requirements[2].id == "R-3");
    CHECK(report.requirements[2].linked_tests == 0);
    CHECK(report.uncovered_count == 1);

    auto j = cdd::coverage_to_json(report);
    CHECK(j["uncovered_count"] == 1);
    CHECK(j["requirements"][0]["linked_tests"] == 2);
}

TEST_CASE("coverage of a missing path is empty") {
    auto report = cdd::compute_coverage("/nonexistent/cdd/contracts");
    CHECK(report.total_count == 0);
    CHECK(report.uncovered_count == 0);
}

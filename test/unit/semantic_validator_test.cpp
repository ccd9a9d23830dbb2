#include "validate/SemanticValidator.hpp"

#include <catch2/catch.hpp>

#include <optional>
#include <string>

using namespace resumeval;

static WorkHistoryItem job(std::optional<DateRange> duration) {
  WorkHistoryItem w;
  w.position_or_title = "Engineer";
  w.company_name = "Acme";
  w.location_or_remote = "Remote";
  w.duration = std::move(duration);
  return w;
}

static DateRange range(const std::string& start, const std::string& end) {
  DateRange d;
  d.start = start;
  d.end = end;
  return d;
}

static Resume base_resume() {
  Resume r;
  r.contact_information.first_name = "Grace";
  r.contact_information.last_name = "Hopper";
  r.contact_information.email = "grace@example.com";
  return r;
}

TEST_CASE("date ranges", "[semantic]") {
  Resume r = base_resume();

  SECTION("start after end") {
    r.work_history.push_back(job(range("2020-05", "2019-01")));
    const auto vs = validate_semantics(r);
    REQUIRE(vs.size() == 1);
    CHECK(vs[0].kind == ViolationKind::InvalidDateRange);
    CHECK(vs[0].severity == Severity::Error);
    CHECK(vs[0].path == "workHistory[0].duration");
  }
  SECTION("mixed precision compares at the coarsest common granularity") {
    r.work_history.push_back(job(range("2020-05", "2020")));
    r.work_history.push_back(job(range("2019-03-15", "2019-03")));
    CHECK(validate_semantics(r).empty());
  }
  SECTION("education ranges are checked too") {
    EducationHistoryItem e;
    e.institution = "Yale";
    e.degree = "PhD";
    e.duration = range("1934", "1930");
    r.education_history.push_back(e);
    e.duration = std::nullopt;
    r.education_history.push_back(e);

    const auto vs = validate_semantics(r);
    REQUIRE(vs.size() == 1);
    CHECK(vs[0].path == "educationHistory[0].duration");
  }
}

TEST_CASE("work history ordering", "[semantic]") {
  Resume r = base_resume();

  SECTION("most recent last is flagged once") {
    r.work_history.push_back(job(range("2018", "2019")));
    r.work_history.push_back(job(range("2020", "2021")));
    const auto vs = validate_semantics(r);
    REQUIRE(vs.size() == 1);
    CHECK(vs[0].kind == ViolationKind::OrderingViolation);
    CHECK(vs[0].severity == Severity::Warning);
    CHECK(vs[0].path == "workHistory[1]");
  }
  SECTION("ongoing first is in order") {
    r.work_history.push_back(job(std::nullopt));
    r.work_history.push_back(job(range("2018", "2020")));
    CHECK(validate_semantics(r).empty());
  }
  SECTION("ongoing after a dated entry is out of order") {
    r.work_history.push_back(job(range("2018", "2020")));
    r.work_history.push_back(job(std::nullopt));
    const auto vs = validate_semantics(r);
    REQUIRE(vs.size() == 1);
    CHECK(vs[0].path == "workHistory[1]");
  }
  SECTION("ties and several ongoing entries are fine") {
    r.work_history.push_back(job(std::nullopt));
    r.work_history.push_back(job(std::nullopt));
    r.work_history.push_back(job(range("2019", "2021-06")));
    r.work_history.push_back(job(range("2015", "2021")));
    r.work_history.push_back(job(range("2010", "2014-12-31")));
    CHECK(validate_semantics(r).empty());
  }
  SECTION("each adjacent inversion is reported") {
    r.work_history.push_back(job(range("2010", "2011")));
    r.work_history.push_back(job(range("2012", "2013")));
    r.work_history.push_back(job(range("2014", "2015")));
    const auto vs = validate_semantics(r);
    REQUIRE(vs.size() == 2);
    CHECK(vs[0].path == "workHistory[1]");
    CHECK(vs[1].path == "workHistory[2]");
  }
  SECTION("configuration") {
    r.work_history.push_back(job(range("2018", "2019")));
    r.work_history.push_back(job(range("2020", "2021")));

    ValidatorConfig cfg;
    cfg.ordering_is_error = true;
    auto vs = validate_semantics(r, cfg);
    REQUIRE(vs.size() == 1);
    CHECK(vs[0].severity == Severity::Error);

    cfg.check_ordering = false;
    CHECK(validate_semantics(r, cfg).empty());
  }
}

#include "validate/ResumeValidator.hpp"

#include <catch2/catch.hpp>

#include <string>

using namespace resumeval;

static const char* kMinimal = R"({
  "contactInformation": {
    "firstName": "Ada",
    "lastName": "Lovelace",
    "email": "ada@example.com",
    "country": "UK"
  },
  "workHistory": [],
  "educationHistory": []
})";

static const char* kFull = R"({
  "contactInformation": {
    "firstName": "Ada",
    "lastName": "Lovelace",
    "email": "ada@example.com",
    "phone": "+44 20 7946 0958",
    "address": null,
    "city": "London",
    "state": null,
    "zipCode": "W1",
    "country": "UK"
  },
  "workHistory": [
    {
      "workPositionOrTitle": "Consultant",
      "workForCompanyName": "Difference Engines",
      "workLocationOrRemote": "Remote",
      "duration": null,
      "workResponsibilitiesAccomplishments": []
    },
    {
      "workPositionOrTitle": "Analyst",
      "workForCompanyName": "Analytical Engines",
      "workLocationOrRemote": "London",
      "duration": {"start": "1842-01", "end": "1843-09"},
      "workResponsibilitiesAccomplishments": ["Published the first program", "Annotated Menabrea"]
    }
  ],
  "educationHistory": [
    {
      "institution": "Home tutoring",
      "degree": "Mathematics",
      "duration": {"start": "1832", "end": "1840"},
      "majors": ["Mathematics"],
      "minors": null,
      "gradePointAverage": null
    }
  ],
  "skills": ["Mathematics", "Programming"],
  "certifications": null,
  "websites": []
})";

TEST_CASE("minimal document validates", "[validator]") {
  const auto res = validate_text(kMinimal);
  CHECK(res.ok());
  CHECK(res.report.violations.empty());
  REQUIRE(res.resume);
  CHECK(res.resume->contact_information.first_name == "Ada");
  CHECK(res.resume->work_history.empty());
  CHECK_FALSE(res.resume->skills.has_value());
}

TEST_CASE("full document normalizes", "[validator]") {
  const auto res = validate_text(kFull);
  REQUIRE(res.ok());
  const Resume& r = *res.resume;
  CHECK(r.contact_information.phone == std::optional<std::string>("+44 20 7946 0958"));
  CHECK_FALSE(r.contact_information.address.has_value());
  REQUIRE(r.work_history.size() == 2);
  CHECK_FALSE(r.work_history[0].duration.has_value());
  CHECK(r.work_history[1].duration->end == "1843-09");
  CHECK(r.work_history[1].responsibilities_accomplishments.size() == 2);
  REQUIRE(r.education_history.size() == 1);
  CHECK(r.education_history[0].majors->front() == "Mathematics");
  REQUIRE(r.websites);
  CHECK(r.websites->empty());
}

TEST_CASE("normalized output validates again", "[validator]") {
  for (const char* text : {kMinimal, kFull}) {
    const auto first = validate_text(text);
    REQUIRE(first.ok());

    const json normalized = resume_to_json(*first.resume);
    const auto second = validate(normalized);
    CHECK(second.ok());
    CHECK(second.report.violations.empty());
    CHECK(resume_to_json(*second.resume) == normalized);
  }
}

TEST_CASE("one extra top-level key", "[validator]") {
  json doc = json::parse(kFull);
  doc["objective"] = "Build engines";

  const auto res = validate(doc);
  CHECK_FALSE(res.ok());
  REQUIRE(res.report.violations.size() == 1);
  CHECK(res.report.violations[0].kind == ViolationKind::AdditionalPropertyNotAllowed);
  CHECK(res.report.violations[0].path == "objective");
}

TEST_CASE("malformed input short-circuits", "[validator]") {
  SECTION("not JSON") {
    const auto res = validate_text("{\"contactInformation\": ");
    REQUIRE(res.report.violations.size() == 1);
    CHECK(res.report.violations[0].kind == ViolationKind::MalformedInput);
    CHECK(res.report.violations[0].path == "$");
    CHECK(res.report.malformed());
    CHECK_FALSE(res.ok());
  }
  SECTION("empty input") {
    CHECK(validate_text("").report.malformed());
  }
  SECTION("root is not an object") {
    const auto res = validate_text("[1, 2, 3]");
    REQUIRE(res.report.violations.size() == 1);
    CHECK(res.report.violations[0].kind == ViolationKind::MalformedInput);
  }
}

TEST_CASE("semantic pass runs only on structurally valid documents", "[validator]") {
  json doc = json::parse(kFull);
  doc["workHistory"][1]["duration"] = {{"start", "1844"}, {"end", "1843"}};

  SECTION("structurally valid: date range reported") {
    const auto res = validate(doc);
    CHECK_FALSE(res.ok());
    REQUIRE(res.report.violations.size() == 1);
    CHECK(res.report.violations[0].kind == ViolationKind::InvalidDateRange);
  }
  SECTION("structural errors suppress semantic findings") {
    doc["contactInformation"]["email"] = "not-an-email";
    const auto res = validate(doc);
    REQUIRE(res.report.violations.size() == 1);
    CHECK(res.report.violations[0].kind == ViolationKind::PatternMismatch);
  }
  SECTION("semantic pass can be disabled") {
    ValidatorConfig cfg;
    cfg.semantic_checks = false;
    CHECK(validate(doc, cfg).ok());
  }
}

TEST_CASE("ordering warnings do not fail validation", "[validator]") {
  json doc = json::parse(kFull);
  std::swap(doc["workHistory"][0], doc["workHistory"][1]);

  const auto res = validate(doc);
  CHECK(res.ok());
  CHECK(res.report.pass());
  REQUIRE(res.report.violations.size() == 1);
  CHECK(res.report.violations[0].kind == ViolationKind::OrderingViolation);
  CHECK(res.report.warning_count() == 1);

  ValidatorConfig strict;
  strict.ordering_is_error = true;
  const auto strict_res = validate(doc, strict);
  CHECK_FALSE(strict_res.ok());
  CHECK(strict_res.report.error_count() == 1);
}

TEST_CASE("validation is repeatable", "[validator]") {
  json doc = json::parse(kFull);
  doc["contactInformation"]["phone"] = "abc";
  doc["skills"] = 3;
  doc["unknown"] = nullptr;

  const auto a = validate(doc);
  const auto b = validate(doc);
  CHECK(report_to_json(a.report) == report_to_json(b.report));
  CHECK(a.report.violations.size() == 3);
}

TEST_CASE("oversized and non-ASCII values are reported, not fatal", "[validator]") {
  json doc = json::parse(kMinimal);

  SECTION("very long email") {
    doc["contactInformation"]["email"] = std::string(100000, 'a') + "@example.com";
    const auto res = validate(doc);
    REQUIRE(res.report.violations.size() == 1);
    CHECK(res.report.violations[0].kind == ViolationKind::PatternMismatch);
    CHECK(res.report.violations[0].value.size() <= 80);
  }
  SECTION("very long phone") {
    doc["contactInformation"]["phone"] = std::string(100000, '5');
    const auto res = validate(doc);
    REQUIRE(res.report.violations.size() == 1);
    CHECK(res.report.violations[0].kind == ViolationKind::PatternMismatch);
  }
  SECTION("non-ASCII phone report serializes") {
    std::string phone = "x";
    for (int i = 0; i < 60; ++i) phone += "\xC3\xA9";
    doc["contactInformation"]["phone"] = phone;

    const auto res = validate(doc);
    REQUIRE(res.report.violations.size() == 1);
    CHECK_NOTHROW(report_to_json(res.report).dump(2));
  }
}

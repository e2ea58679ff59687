#include "requirement.h"

#include "doctest.h"

#include <stdexcept>

TEST_CASE("release_version_parse pads for ordering and keeps text") {
  auto const v{ skillet::release_version_parse("2.31") };
  CHECK(v.text == "2.31");
  CHECK(skillet::release_version_compare(v, skillet::release_version_parse("2.31.0")) == 0);
  CHECK(skillet::release_version_compare(v, skillet::release_version_parse("2.4")) > 0);
  CHECK(skillet::release_version_compare(skillet::release_version_parse("3"),
                                         skillet::release_version_parse("3.12")) < 0);
}

TEST_CASE("release_version_parse rejects unsupported forms") {
  CHECK_THROWS_AS(skillet::release_version_parse("1.0rc1"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::release_version_parse("1.0+local"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::release_version_parse("1.2.3.4"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::release_version_parse(""), std::invalid_argument);
  CHECK_THROWS_AS(skillet::release_version_parse("1..2"), std::invalid_argument);
}

TEST_CASE("requirement_normalize_name") {
  CHECK(skillet::requirement_normalize_name("Requests") == "requests");
  CHECK(skillet::requirement_normalize_name("typing_extensions") == "typing-extensions");
  CHECK(skillet::requirement_normalize_name("zope.interface") == "zope-interface");
  CHECK(skillet::requirement_normalize_name("A-_.b") == "a-b");
}

TEST_CASE("requirement_parse name only") {
  auto const r{ skillet::requirement_parse("beautifulsoup4") };
  CHECK(r.name == "beautifulsoup4");
  CHECK(r.extras.empty());
  CHECK(r.range.unbounded());
  CHECK(r.marker.empty());
  CHECK(r.render() == "beautifulsoup4");
}

TEST_CASE("requirement_parse with extras, specifier and marker") {
  auto const r{ skillet::requirement_parse(
      "Requests[socks, security] >=2.28, <3 ; python_version  >= '3.8'") };
  CHECK(r.name == "requests");
  CHECK(r.extras == std::set<std::string>{ "security", "socks" });
  CHECK(r.marker == "python_version >= '3.8'");
  CHECK(r.render() == "requests[security,socks]>=2.28,<3; python_version >= '3.8'");
}

TEST_CASE("requirement_parse parenthesized specifier") {
  auto const r{ skillet::requirement_parse("httpx (>=0.27)") };
  CHECK(r.render() == "httpx>=0.27");
}

TEST_CASE("requirement_parse compatible release and wildcard") {
  CHECK(skillet::requirement_parse("pkg~=2.2").render() == "pkg>=2.2,<3");
  CHECK(skillet::requirement_parse("pkg~=1.4.5").render() == "pkg>=1.4.5,<1.5");
  CHECK(skillet::requirement_parse("pkg==3.*").render() == "pkg>=3,<4");
  CHECK(skillet::requirement_parse("pkg==1.2.*").render() == "pkg>=1.2,<1.3");
  CHECK(skillet::requirement_parse("pkg==1.2").render() == "pkg==1.2");
}

TEST_CASE("requirement_parse exclusions") {
  CHECK(skillet::requirement_parse("pkg>=1,!=1.5").render() == "pkg>=1,!=1.5");
  CHECK(skillet::requirement_parse("pkg>=2,!=1.5").render() == "pkg>=2");
}

TEST_CASE("requirement_parse rejects malformed input") {
  CHECK_THROWS_AS(skillet::requirement_parse(""), std::invalid_argument);
  CHECK_THROWS_AS(skillet::requirement_parse(">=1.0"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::requirement_parse("pkg>=banana"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::requirement_parse("pkg~=2"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::requirement_parse("pkg @ https://example.com/pkg.whl"),
                  std::invalid_argument);
  CHECK_THROWS_AS(skillet::requirement_parse("pkg[extra"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::requirement_parse("pkg>=1,,<2"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::requirement_parse("pkg===1.0"), std::invalid_argument);
  CHECK_THROWS_AS(skillet::requirement_parse("pkg; "), std::invalid_argument);
}

TEST_CASE("version_range intersection of overlapping ranges") {
  auto const a{ skillet::version_range_parse(">=2.28,<3") };
  auto const b{ skillet::version_range_parse(">=2.31") };
  auto const merged{ a.intersect(b) };
  CHECK_FALSE(merged.empty());
  CHECK(merged.render() == ">=2.31,<3");
}

TEST_CASE("version_range intersection of disjoint ranges is empty") {
  auto const a{ skillet::version_range_parse("<2") };
  auto const b{ skillet::version_range_parse(">=2.1") };
  CHECK(a.intersect(b).empty());

  auto const pin_a{ skillet::version_range_parse("==1.0") };
  auto const pin_b{ skillet::version_range_parse("==1.1") };
  CHECK(pin_a.intersect(pin_b).empty());
}

TEST_CASE("version_range touching bounds") {
  CHECK(skillet::version_range_parse(">=2").intersect(skillet::version_range_parse("<=2"))
            .render() == "==2");
  CHECK(skillet::version_range_parse(">2").intersect(skillet::version_range_parse("<=2"))
            .empty());
  CHECK(skillet::version_range_parse("==2").intersect(skillet::version_range_parse("!=2.0"))
            .empty());
}

TEST_CASE("version_range exclusive bound wins a tie") {
  auto const r{ skillet::version_range_parse(">=1.0").intersect(
      skillet::version_range_parse(">1")) };
  CHECK(r.render() == ">1");
}

TEST_CASE("version_range python requirement takes the maximum minimum") {
  auto const r{ skillet::version_range_parse(">=3.10").intersect(
      skillet::version_range_parse(">=3.12")) };
  CHECK(r.render() == ">=3.12");
}

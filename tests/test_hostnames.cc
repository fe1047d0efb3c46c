#include <algorithm>
#include <set>

#include <catch2/catch.hpp>

#include "fixtures.hh"

using stratus::ConfigError;
using stratus::ordered_node;
using stratus_test::str;
using stratus_test::yaml;
namespace si = stratus::internal;

namespace {

  using ZoneProfiles = std::vector< std::pair< std::string, std::string > >;

  ZoneProfiles zones_of( std::size_t k ) {
    ZoneProfiles zp;
    for ( std::size_t i = 0; i < k; ++i ) {
      const std::string zone( 1, static_cast< char >('A' + i) );
      zp.emplace_back( zone, "web_test_p1" + zone );
    }
    return zp;
  }

  std::size_t hosts_in( const ordered_node& assigned,
    const std::string& profile )
  {
    return assigned.contains( profile ) ? assigned.at( profile ).size() : 0;
  }

} // namespace

TEST_CASE("Hostname ordinals are zero padded", "[hostnames]") {
  const std::string tmpl = "web%02d.test.p1.example.com";
  CHECK(si::format_hostname(tmpl, 1) == "web01.test.p1.example.com");
  CHECK(si::format_hostname(tmpl, 12) == "web12.test.p1.example.com");
  // Wider counts widen the field instead of truncating
  CHECK(si::format_hostname(tmpl, 100) == "web100.test.p1.example.com");
}

TEST_CASE("Hostname templates need exactly one placeholder", "[hostnames][error]") {
  CHECK_THROWS_AS(si::format_hostname("web.test.p1.example.com", 1),
    ConfigError);
  CHECK_THROWS_AS(si::format_hostname("web%02d-%02d.example.com", 1),
    ConfigError);
}

TEST_CASE("Profile names and hostname templates", "[hostnames][naming]") {
  CHECK(si::profile_name("web", "test", "p1", "A") == "web_test_p1A");
  CHECK(si::profile_name("db", "prod", "aws", "eu-west-1b")
    == "db_prod_awseu-west-1b");
  CHECK(si::hostname_template("web", "test", "p1", "example.com")
    == "web%02d.test.p1.example.com");
  CHECK(si::hostname_template("db", "prod", "aws", "corp.internal")
    == "db%02d.prod.aws.corp.internal");
}

TEST_CASE("Cycle order moves one seeded zone to the front", "[hostnames][cycle]") {
  const std::vector< std::string > zones = { "A", "B", "C", "D" };
  const std::string seed = "web%02d.test.p1.example.com";

  const auto order = si::cycle_order( seed, zones );
  CHECK(si::cycle_order(seed, zones) == order);

  SECTION("same zones, one moved to the front") {
    auto sorted = order;
    std::sort( sorted.begin(), sorted.end() );
    CHECK(sorted == zones);

    std::vector< std::string > rest = zones;
    rest.erase( std::find(rest.begin(), rest.end(), order.front()) );
    CHECK(std::vector< std::string >(order.begin() + 1, order.end()) == rest);
  }

  SECTION("different templates start in different zones") {
    std::set< std::string > firsts;
    for ( int i = 0; i < 20; ++i ) {
      const std::string tmpl = "role" + std::to_string( i )
        + "%02d.test.p1.example.com";
      firsts.insert( si::cycle_order(tmpl, zones).front() );
    }
    CHECK(firsts.size() >= 2);
  }

  SECTION("short zone lists are returned as is") {
    CHECK(si::cycle_order(seed, { "A" }) == std::vector< std::string >{ "A" });
    CHECK(si::cycle_order(seed, {}).empty());
  }
}

TEST_CASE("Hosts are assigned round-robin over the cycle order", "[hostnames][distribution]") {
  const std::string tmpl = "web%02d.test.p1.example.com";
  const ZoneProfiles zp = zones_of( 3 );
  const ordered_node defaults = yaml( "minion:\n  master: salt.example.com" );

  const ordered_node assigned = si::distribute_hostnames( zp, 5, tmpl,
    defaults );
  const auto order = si::cycle_order( tmpl, { "A", "B", "C" } );
  auto profile = []( const std::string& zone ) { return "web_test_p1" + zone; };

  REQUIRE(hosts_in(assigned, profile(order[0])) == 2);
  REQUIRE(hosts_in(assigned, profile(order[1])) == 2);
  REQUIRE(hosts_in(assigned, profile(order[2])) == 1);

  const ordered_node& first = assigned.at( profile(order[0]) );
  CHECK(first.contains("web01.test.p1.example.com"));
  CHECK(first.contains("web04.test.p1.example.com"));
  CHECK(assigned.at(profile(order[1])).contains("web02.test.p1.example.com"));
  CHECK(assigned.at(profile(order[1])).contains("web05.test.p1.example.com"));
  CHECK(assigned.at(profile(order[2])).contains("web03.test.p1.example.com"));

  // Every host carries a copy of the map defaults
  CHECK(str(first.at("web01.test.p1.example.com").at("minion").at("master"))
    == "salt.example.com");
}

TEST_CASE("Host counts differ by at most one between zones", "[hostnames][distribution]") {
  const std::string tmpl = "app%02d.test.p1.example.com";
  for ( std::size_t k = 1; k <= 4; ++k ) {
    const ZoneProfiles zp = zones_of( k );
    std::vector< std::string > zones;
    for ( const auto& z : zp ) zones.push_back( z.first );
    const auto order = si::cycle_order( tmpl, zones );

    for ( std::int64_t n = 0; n <= 25; ++n ) {
      CAPTURE(k, n);
      const ordered_node assigned = si::distribute_hostnames( zp, n, tmpl,
        ordered_node::mapping() );

      std::size_t total = 0;
      for ( std::size_t i = 0; i < order.size(); ++i ) {
        const std::size_t expected = static_cast< std::size_t >( n ) / k
          + ( i < static_cast< std::size_t >(n) % k ? 1 : 0 );
        CHECK(hosts_in(assigned, "web_test_p1" + order[i]) == expected);
        total += hosts_in( assigned, "web_test_p1" + order[i] );
      }
      CHECK(total == static_cast< std::size_t >(n));
    }
  }
}

TEST_CASE("Hostname distribution edge cases", "[hostnames][distribution]") {
  const std::string tmpl = "web%02d.test.p1.example.com";

  SECTION("no hosts requested") {
    CHECK(si::distribute_hostnames(zones_of(3), 0, tmpl,
      ordered_node::mapping()).size() == 0);
    CHECK(si::distribute_hostnames({}, 0, tmpl,
      ordered_node::mapping()).size() == 0);
  }
  SECTION("hosts but no zones") {
    CHECK_THROWS_AS(si::distribute_hostnames({}, 2, tmpl,
      ordered_node::mapping()), ConfigError);
  }
  SECTION("bad template fails before any assignment") {
    CHECK_THROWS_AS(si::distribute_hostnames(zones_of(2), 2, "web.example.com",
      ordered_node::mapping()), ConfigError);
  }
}

#include <catch2/catch.hpp>

#include "fixtures.hh"

using stratus::ConfigError;
using stratus::RoleLayer;
using stratus::ordered_node;
using stratus_test::str;
using stratus_test::yaml;
namespace si = stratus::internal;

namespace {

  std::vector< std::string > group_ids( const ordered_node& fields ) {
    std::vector< std::string > ids;
    for ( const auto& g : fields.at("security_groups") ) ids.push_back( str(g) );
    return ids;
  }

} // namespace

TEST_CASE("Role layers: later layers win", "[role][merge]") {
  const std::vector< RoleLayer > layers = {
    { "defaults.profiles", yaml("size: t2.nano\nimage: ami-base\nsync_after_install: all") },
    { "providers.p1.web", yaml("size: t2.micro") },
    { "servers.p1.test[0]", yaml("size: c5.xlarge\niam_profile: web-role") },
  };
  const ordered_node merged = si::merge_layers( layers );
  CHECK(str(merged.at("size")) == "c5.xlarge");
  CHECK(str(merged.at("image")) == "ami-base");
  CHECK(str(merged.at("sync_after_install")) == "all");
  CHECK(str(merged.at("iam_profile")) == "web-role");
}

TEST_CASE("Role layers: mappings merge deeply, null clears", "[role][merge]") {
  const std::vector< RoleLayer > layers = {
    { "defaults.profiles", yaml("iam_profile: base\nnetwork:\n  public: false\n  zone: a") },
    { "servers.p1.test[0]", yaml("iam_profile: null\nnetwork:\n  public: true") },
  };
  const ordered_node merged = si::merge_layers( layers );
  CHECK_FALSE(merged.contains("iam_profile"));
  CHECK(merged.at("network").at("public").get_value< bool >());
  CHECK(str(merged.at("network").at("zone")) == "a");
}

TEST_CASE("Role layers: empty layers are skipped, scalars rejected", "[role][merge][error]") {
  std::vector< RoleLayer > layers = {
    { "defaults.profiles", ordered_node() },
    { "providers.p1.web", yaml("size: t2.micro") },
  };
  CHECK(str(si::merge_layers(layers).at("size")) == "t2.micro");

  layers.push_back( { "servers.p1.test[0]", yaml("[a, b]") } );
  try {
    si::merge_layers( layers );
    FAIL("a sequence layer must be rejected");
  }
  catch ( const ConfigError& err ) {
    CHECK(err.path() == "servers.p1.test[0]");
  }
}

TEST_CASE("Security groups: common group closes the list exactly once", "[role][security-groups]") {
  const std::vector< std::string > common = { "sg-common" };

  SECTION("absent groups become the common group") {
    ordered_node fields = yaml("size: t2.micro");
    si::normalize_security_groups( fields, common );
    CHECK(group_ids(fields) == std::vector< std::string >{ "sg-common" });
  }
  SECTION("a single id is wrapped in a list") {
    ordered_node fields = yaml("security_groups: sg-web");
    si::normalize_security_groups( fields, common );
    CHECK(group_ids(fields) == std::vector< std::string >{ "sg-web", "sg-common" });
  }
  SECTION("a role listing the common group does not duplicate it") {
    ordered_node fields = yaml("security_groups: [sg-common, sg-a, sg-b]");
    si::normalize_security_groups( fields, common );
    CHECK(group_ids(fields)
      == std::vector< std::string >{ "sg-a", "sg-b", "sg-common" });
  }
  SECTION("no common group declared") {
    ordered_node fields = yaml("security_groups: [sg-a]");
    si::normalize_security_groups( fields, {} );
    CHECK(group_ids(fields) == std::vector< std::string >{ "sg-a" });
  }
  SECTION("a mapping is not a group list") {
    ordered_node fields = yaml("security_groups:\n  a: b");
    CHECK_THROWS_AS(si::normalize_security_groups(fields, common), ConfigError);
  }
}

TEST_CASE("Volumes: default tags never overwrite authored ones", "[role][volumes]") {
  ordered_node fields = yaml(R"(volumes:
  - size: 100
    device: /dev/xvdf
    type: gp3
  - size: 20
    device: /dev/xvdg
    tags:
      Service: backup
      Owner: dba
)");
  si::tag_volumes( fields, "test", "db" );

  const ordered_node& first = fields.at("volumes").at(0).at("tags");
  CHECK(str(first.at("Environment")) == "test");
  CHECK(str(first.at("Role")) == "db");
  CHECK(str(first.at("Service")) == "ebs");
  CHECK(str(first.at("VolumeType")) == "gp3");

  const ordered_node& second = fields.at("volumes").at(1).at("tags");
  CHECK(str(second.at("Service")) == "backup");
  CHECK(str(second.at("Owner")) == "dba");
  CHECK(str(second.at("Environment")) == "test");
  CHECK_FALSE(second.contains("VolumeType"));

  // Volume attributes themselves pass through
  CHECK(fields.at("volumes").at(0).at("size").get_value< std::int64_t >() == 100);
}

TEST_CASE("Volumes: malformed specs are structural errors", "[role][volumes][error]") {
  ordered_node not_a_list = yaml("volumes:\n  size: 10");
  CHECK_THROWS_AS(si::tag_volumes(not_a_list, "test", "db"), ConfigError);

  ordered_node scalar_entry = yaml("volumes: [gp3]");
  CHECK_THROWS_AS(si::tag_volumes(scalar_entry, "test", "db"), ConfigError);

  ordered_node bad_tags = yaml("volumes:\n  - size: 10\n    tags: [a]");
  CHECK_THROWS_AS(si::tag_volumes(bad_tags, "test", "db"), ConfigError);
}

TEST_CASE("Role resolution: required fields gate", "[role][validation]") {
  const std::vector< std::string > common = { "sg-common" };

  SECTION("complete role") {
    const auto res = si::resolve_role( "web", "test",
      { { "providers.p1.web", yaml("size: t2.micro\nimage: ami-1") } }, common );
    CHECK(res.complete());
    CHECK(group_ids(res.fields) == std::vector< std::string >{ "sg-common" });
  }
  SECTION("missing image") {
    const auto res = si::resolve_role( "web", "test",
      { { "providers.p1.web", yaml("size: t2.micro") } }, common );
    CHECK_FALSE(res.complete());
    CHECK(res.missing == std::vector< std::string >{ "image" });
  }
  SECTION("no security group anywhere") {
    const auto res = si::resolve_role( "web", "test",
      { { "providers.p1.web", yaml("size: t2.micro\nimage: ami-1") } }, {} );
    CHECK(res.missing == std::vector< std::string >{ "security_groups" });
  }
  SECTION("security groups present but empty") {
    const auto res = si::resolve_role( "web", "test", { { "providers.p1.web",
      yaml("size: t2.micro\nimage: ami-1\nsecurity_groups: []") } }, {} );
    CHECK(res.fields.contains("security_groups"));
    CHECK_FALSE(res.complete());
    CHECK(res.missing == std::vector< std::string >{ "security_groups" });
  }
  SECTION("image cleared by an override") {
    const auto res = si::resolve_role( "web", "test", {
      { "providers.p1.web", yaml("size: t2.micro\nimage: ami-1") },
      { "servers.p1.test[0]", yaml("image: null") } }, common );
    CHECK(res.missing == std::vector< std::string >{ "image" });
  }
}

TEST_CASE("Role resolution does not modify its layers", "[role]") {
  const std::vector< RoleLayer > layers = {
    { "providers.p1.db", yaml("size: r5.large\nimage: ami-1\nsecurity_groups: sg-db\n"
      "volumes:\n  - size: 10\n    type: gp2") },
  };
  const std::string before = ordered_node::serialize( layers[0].fields );
  si::resolve_role( "db", "test", layers, { "sg-common" } );
  CHECK(ordered_node::serialize(layers[0].fields) == before);
}

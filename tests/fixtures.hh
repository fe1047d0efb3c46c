#pragma once

#include <string>

#include "stratus.hh"

namespace stratus_test {

  inline stratus::ordered_node yaml( const std::string& text ) {
    return stratus::ordered_node::deserialize( text );
  }

  inline std::string str( const stratus::ordered_node& n ) {
    return stratus::internal::to_string_any( n );
  }

  // One provider with three zones in two environments; "web" takes every
  // attribute from the provider default layer, "db" has its own size and
  // security group and overrides count and volumes per instance
  inline const std::string SCENARIO = R"(defaults:
  providers:
    default_servers: 2
    rename_on_destroy: true
    ssh_interface: private_ips
    ssh_username: ec2-user
  profiles:
    del_root_vol_on_destroy: true
    del_all_vols_on_destroy: true
    sync_after_install: all
  mappings:
    minion:
      master: salt.example.com
providers:
  p1:
    id: AKIAEXAMPLE
    key: secret
    keyname: deploy
    provider: ec2
    location: eu-west-1
    default_servers: 5
    subnets:
      test:
        - A: subnet-a1
        - B: subnet-b1
        - C: subnet-c1
      mgmt:
        - A: subnet-a2
        - B: subnet-b2
        - C: subnet-c2
    sizes:
      default: t2.micro
      db: r5.large
    images:
      default: ami-1234
    security_groups:
      common: sg-common
      db: sg-db
servers:
  p1:
    test:
      - web
      - db:
          servers: 1
          volumes:
            - size: 100
              device: /dev/xvdf
              type: gp3
)";

} // namespace stratus_test

// ┏━┓╺┳╸┏━┓┏━┓╺┳╸╻ ╻┏━┓
// ┗━┓ ┃ ┣┳┛┣━┫ ┃ ┃ ┃┗━┓
// ┗━┛ ╹ ╹┗╸╹ ╹ ╹ ┗━┛┗━┛
//  Layered cloud map expansion for salt-cloud
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the stratus developers
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace stratus {

  // Specialized version of the fkYAML basic_node template. Mapping keys
  // keep their insertion order (fkyaml::ordered_map)
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  enum class Severity { Info, Warning, Error };

  inline const char* severity_name( Severity severity ) {
    switch ( severity ) {
      case Severity::Info: return "info";
      case Severity::Warning: return "warning";
      case Severity::Error: return "error";
    }
    return "unknown";
  }

  // One structured record of an expansion. The path is a dotted location in
  // the input trees, e.g., "servers.p1.test[2]"
  struct Diagnostic {
    Severity severity;
    std::string path;
    std::string message;
  };

  // Base class for problems found in the input trees
  class Error : public std::runtime_error {
  public:
    inline Error( const std::string& path, const std::string& detail )
      : std::runtime_error( path.empty() ? detail : path + ": " + detail ),
      path_( path ), detail_( detail ) {}

    const std::string& path() const { return path_; }
    const std::string& detail() const { return detail_; }

  private:
    std::string path_;
    std::string detail_;
  };

  // Malformed declarations. Fatal for the enclosing provider or role
  class ConfigError : public Error {
  public:
    using Error::Error;
  };

  // References to providers, environments or zones that are not declared.
  // Only the referencing item is skipped
  class ReferenceError : public Error {
  public:
    using Error::Error;
  };

  // Result of one expansion: the three output trees plus every diagnostic
  // recorded along the way, in processing order
  struct Expansion {
    // provider -> merged provider attributes
    ordered_node providers = ordered_node::mapping();
    // environment -> profile name -> profile
    ordered_node profiles = ordered_node::mapping();
    // environment -> profile name -> hostname -> per-host defaults
    ordered_node maps = ordered_node::mapping();

    std::vector< Diagnostic > diagnostics;

    inline std::size_t count( Severity severity ) const;
    inline bool has_errors() const { return count( Severity::Error ) > 0; }
  };

  // One availability zone of an environment and the subnet bound to it
  struct SubnetBinding {
    std::string zone;
    std::string subnet_id;
  };

  struct EnvironmentLayout {
    // Zone labels in declaration order
    std::vector< std::string > zones;
    // zone -> subnet id
    std::unordered_map< std::string, std::string > subnets;

    inline std::optional< std::string > subnet_for(
      const std::string& zone ) const;
  };

  using EnvironmentMap = std::map< std::string, EnvironmentLayout >;

  // Per-zone pin of a network interface to an existing interface or to a
  // static private address
  struct InterfaceOverride {
    enum class Kind { InterfaceId, Address };
    Kind kind;
    std::string value;
  };

  // One entry of a role's "interfaces" list
  struct InterfaceSpec {
    std::string environment;
    // zone -> override
    std::unordered_map< std::string, InterfaceOverride > overrides;
  };

  // An immutable contribution to a role definition. Layers are folded in
  // order and later layers win
  struct RoleLayer {
    std::string origin;
    ordered_node fields;
  };

  struct RoleResolution {
    ordered_node fields;
    // Required fields absent after the merge
    std::vector< std::string > missing;

    inline bool complete() const { return missing.empty(); }
  };

  // A provider after loading: its output config plus what the later stages
  // read from it
  struct ProviderModel {
    std::string name;
    ordered_node config;
    std::int64_t default_servers = 0;
    EnvironmentMap environments;
    // role -> attributes declared by the provider (size, image, volumes,
    // security_groups)
    std::map< std::string, ordered_node > roles;
    std::vector< std::string > common_groups;
  };

  struct ExpanderOptions {
    // Top-level keys used when all inputs arrive in one document
    std::string providers_key = "providers";
    std::string servers_key = "servers";
    std::string defaults_key = "defaults";

    // Last hostname segment unless defaults.hostnames.domain is set
    std::string domain = "example.com";
  };

  class Expander {
  public:
    inline explicit Expander( ExpanderOptions options = ExpanderOptions() )
      : options_( std::move(options) ), session_() {}

    // Expand the providers, servers and defaults trees
    Expansion expand( const ordered_node& providers,
      const ordered_node& servers, const ordered_node& defaults );

    // Expand one document holding all three trees under the configured
    // top-level keys
    Expansion expand( const ordered_node& document );
    Expansion expand( std::istream& in );

    const ExpanderOptions& options() const { return options_; }

  private:

    // Wraps internal state refreshed upon each call to expand(...)
    struct ExpandSession {
      ordered_node provider_defaults;
      ordered_node role_defaults;
      ordered_node host_defaults;
      std::string domain;

      // Successfully loaded providers, sorted by name
      std::map< std::string, ProviderModel > providers;
      std::unordered_set< std::string > failed_providers;

      Expansion out;
    };

    ExpanderOptions options_;
    ExpandSession session_;

    // Processing stages
    void load_defaults( const ordered_node& defaults );
    void load_providers( const ordered_node& providers );
    ProviderModel load_provider( const std::string& name,
      const ordered_node& decl );
    void expand_servers( const ordered_node& servers );
    void expand_role( const ProviderModel& provider, const std::string& env,
      const ordered_node& entry, const std::string& path );

    std::vector< RoleLayer > layers_for( const ProviderModel& provider,
      const std::string& role, const ordered_node& overrides,
      const std::string& path ) const;

    void note( Severity severity, const std::string& path,
      const std::string& message );
    void note( Severity severity, const Error& err,
      const std::string& fallback_path );

  }; // class Expander

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string ORDINAL_PLACEHOLDER = "%02d";

  // Upper bound on the instance count of one role in one environment
  inline constexpr std::int64_t MAX_SERVER_COUNT = 9999;

  // Keys read from the provider and server trees
  inline const std::string SUBNETS = "subnets";
  inline const std::string SIZES = "sizes";
  inline const std::string IMAGES = "images";
  inline const std::string VOLUMES = "volumes";
  inline const std::string SECURITY_GROUPS = "security_groups";
  inline const std::string DEFAULT_SERVERS = "default_servers";
  inline const std::string SERVERS = "servers";
  inline const std::string INTERFACES = "interfaces";
  inline const std::string SIZE = "size";
  inline const std::string IMAGE = "image";
  inline const std::string TYPE = "type";
  inline const std::string TAGS = "tags";

  // Reserved role names inside a provider's per-role mappings
  inline const std::string DEFAULT_ROLE = "default";
  inline const std::string COMMON_GROUP = "common";

  // Sections of the defaults tree
  inline const std::string PROVIDER_DEFAULTS = "providers";
  inline const std::string PROFILE_DEFAULTS = "profiles";
  inline const std::string MAPPING_DEFAULTS = "mappings";
  inline const std::string HOSTNAME_DEFAULTS = "hostnames";
  inline const std::string DOMAIN = "domain";

  // Explicit forms of tagged input values
  inline const std::string BINDING_ZONE = "az";
  inline const std::string BINDING_SUBNET = "subnet";
  inline const std::string OVERRIDE_INTERFACE_ID = "interface_id";
  inline const std::string OVERRIDE_ADDRESS = "address";

  // Output keys, in the vocabulary of salt-cloud EC2 profiles
  inline const std::string PROVIDER = "provider";
  inline const std::string TAG = "tag";
  inline const std::string NETWORK_INTERFACES = "network_interfaces";
  inline const std::string DEVICE_INDEX = "DeviceIndex";
  inline const std::string SUBNET_ID = "SubnetId";
  inline const std::string SECURITY_GROUP_ID = "SecurityGroupId";
  inline const std::string PRIVATE_IP_ADDRESS = "PrivateIpAddress";
  inline const std::string NETWORK_INTERFACE_ID = "NetworkInterfaceId";
  inline const std::string TAG_ENVIRONMENT = "Environment";
  inline const std::string TAG_ROLE = "Role";
  inline const std::string TAG_SERVICE = "Service";
  inline const std::string TAG_VOLUME_TYPE = "VolumeType";
  inline const std::string EBS_SERVICE = "ebs";

  // Connects path segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( std::size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  inline std::string child_path( const std::string& base,
    const std::string& key )
  {
    if ( base.empty() ) return key;
    return base + PATH_DELIMITER + key;
  }

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, std::size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  inline std::string join_names( const std::vector< std::string >& names ) {
    if ( names.empty() ) return "(none)";
    std::string s;
    for ( std::size_t i = 0; i < names.size(); ++i ) {
      if ( i ) s += ", ";
      s += names[ i ];
    }
    return s;
  }

  inline bool is_non_null_scalar( const ordered_node& n ) {
    return ( n.is_scalar() && !n.is_null() );
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Mapping keys may be parsed as integers (e.g., a zone labelled 1)
  inline std::string key_string( const ordered_node& key ) {
    return to_string_any( key );
  }

  // Deep merge of an overlay node onto a base node. Executes simple
  // replacement for scalars and sequences. An explicit null overlay clears
  // the corresponding base node. For an overlay and base that are both
  // mappings, deep merge the contents with an "overlay wins" policy.
  inline ordered_node deep_merge( const ordered_node& base,
    const ordered_node& overlay )
  {
    // An explicit null clears the corresponding prior entry
    if ( overlay.is_null() ) return ordered_node();

    // Non-mapping overlays (scalars and sequences) replace prior base values
    if ( !overlay.is_mapping() ) return overlay;

    // If the overlay is a mapping but the base isn't, the overlay replaces it
    if ( !base.is_mapping() ) return overlay;

    ordered_node result = base;
    for ( const auto& [mk, mv] : overlay.map_items() ) {
      const std::string k = key_string( mk );
      if ( result.contains(k) ) {
        result[ k ] = deep_merge( result.at(k), mv );
      } else {
        result[ k ] = mv;
      }
    }
    return result;
  }

  // Recursively drop null-valued mapping entries (cleared by a merge)
  inline ordered_node drop_nulls( const ordered_node& node ) {
    if ( node.is_mapping() ) {
      ordered_node pruned = ordered_node::mapping();
      for ( const auto& [mk, mv] : node.map_items() ) {
        if ( mv.is_null() ) continue;
        pruned[ key_string(mk) ] = drop_nulls( mv );
      }
      return pruned;
    }
    if ( node.is_sequence() ) {
      std::vector< ordered_node > out;
      out.reserve( node.size() );
      for ( const auto& el : node ) out.push_back( drop_nulls(el) );
      return make_node_from( out );
    }
    return node;
  }

  // Copy of a mapping without the listed keys
  inline ordered_node without_keys( const ordered_node& node,
    const std::unordered_set< std::string >& drop )
  {
    ordered_node kept = ordered_node::mapping();
    for ( const auto& [mk, mv] : node.map_items() ) {
      const std::string k = key_string( mk );
      if ( drop.count(k) ) continue;
      kept[ k ] = mv;
    }
    return kept;
  }

  // Mapping entries ordered lexicographically by key, so that processing
  // order does not depend on how the input was authored
  inline std::vector< std::pair< std::string, ordered_node > >
    sorted_items( const ordered_node& node )
  {
    std::vector< std::pair< std::string, ordered_node > > items;
    for ( const auto& [mk, mv] : node.map_items() ) {
      items.emplace_back( key_string(mk), mv );
    }
    std::stable_sort( items.begin(), items.end(),
      []( const auto& a, const auto& b ) { return a.first < b.first; } );
    return items;
  }

  inline void require_mapping( const ordered_node& node,
    const std::string& path, const std::string& what )
  {
    if ( !node.is_mapping() ) {
      throw ConfigError( path, what + " must be a mapping" );
    }
  }

  inline std::string scalar_string( const ordered_node& node,
    const std::string& path, const std::string& what )
  {
    if ( !is_non_null_scalar(node) ) {
      throw ConfigError( path, what + " must be a scalar value" );
    }
    return to_string_any( node );
  }

  // Instance counts: integers in [0, MAX_SERVER_COUNT]
  inline std::int64_t parse_count( const ordered_node& node,
    const std::string& path )
  {
    if ( !node.is_integer() ) {
      throw ConfigError( path, "server count must be an integer, found '"
        + to_string_any(node) + "'" );
    }
    const std::int64_t count = to_native_checked< std::int64_t >( node );
    if ( count < 0 ) {
      throw ConfigError( path, "server count must not be negative, found "
        + std::to_string(count) );
    }
    if ( count > MAX_SERVER_COUNT ) {
      throw ConfigError( path, "server count must not exceed "
        + std::to_string(MAX_SERVER_COUNT) + ", found "
        + std::to_string(count) );
    }
    return count;
  }

  // A security group id or a list of them, duplicates removed
  inline std::vector< std::string > parse_group_ids( const ordered_node& node,
    const std::string& path )
  {
    std::vector< std::string > ids;
    auto add = [&]( const std::string& id ) {
      if ( std::find(ids.begin(), ids.end(), id) == ids.end() ) {
        ids.push_back( id );
      }
    };
    if ( node.is_sequence() ) {
      for ( std::size_t i = 0; i < node.size(); ++i ) {
        add( scalar_string(node.at(i), seq_indexed(path, i),
          "security group id") );
      }
    }
    else {
      add( scalar_string(node, path, "security group id") );
    }
    return ids;
  }

  // Input documents may not use YAML anchors or aliases
  inline void reject_anchors_and_aliases( const ordered_node& node,
    const std::vector< std::string >& path )
  {
    if ( node.is_anchor() || node.is_alias() ) {
      std::ostringstream oss;
      oss << "YAML " << ( node.is_anchor() ? "anchors" : "aliases" )
        << " are not supported in stratus input";
      throw ConfigError( join_path(path), oss.str() );
    }

    if ( node.is_mapping() ) {
      for ( const auto& [mk, mv] : node.map_items() ) {
        std::vector< std::string > p2 = path;
        p2.push_back( key_string(mk) );
        reject_anchors_and_aliases( mv, p2 );
      }
    }
    else if ( node.is_sequence() ) {
      for ( std::size_t i = 0; i < node.size(); ++i ) {
        std::vector< std::string > p2 = path;
        if ( p2.empty() ) p2.push_back( seq_indexed("", i) );
        else p2.back() = seq_indexed( p2.back(), i );
        reject_anchors_and_aliases( node.at(i), p2 );
      }
    }
  }

  // Short rendering of a role's merged state for diagnostics
  inline std::string describe_fields( const ordered_node& fields ) {
    if ( !fields.is_mapping() || fields.size() == 0 ) return "no fields";
    std::ostringstream oss;
    bool first = true;
    for ( const auto& [mk, mv] : fields.map_items() ) {
      if ( !first ) oss << ", ";
      first = false;
      oss << key_string( mk ) << ": ";
      if ( mv.is_sequence() ) {
        oss << '[';
        for ( std::size_t i = 0; i < mv.size(); ++i ) {
          if ( i ) oss << ", ";
          const ordered_node& el = mv.at( i );
          oss << ( is_non_null_scalar(el) ? to_string_any(el) : "{...}" );
        }
        oss << ']';
      }
      else if ( mv.is_mapping() ) {
        oss << "{...}";
      }
      else {
        oss << to_string_any( mv );
      }
    }
    return oss.str();
  }

  // Environment Builder

  // Accepts the explicit form { az: <label>, subnet: <id> } and the
  // single-key shorthand { <label>: <id> }
  inline SubnetBinding parse_subnet_binding( const ordered_node& el,
    const std::string& path )
  {
    if ( !el.is_mapping() ) {
      throw ConfigError( path, "subnet binding must map an availability zone"
        " to a subnet id" );
    }
    if ( el.size() == 2 && el.contains(BINDING_ZONE)
      && el.contains(BINDING_SUBNET) )
    {
      SubnetBinding b;
      b.zone = scalar_string( el.at(BINDING_ZONE),
        child_path(path, BINDING_ZONE), "availability zone" );
      b.subnet_id = scalar_string( el.at(BINDING_SUBNET),
        child_path(path, BINDING_SUBNET), "subnet id" );
      return b;
    }
    if ( el.size() != 1 ) {
      std::ostringstream oss;
      oss << "subnet binding must hold exactly one availability zone (or the"
        << " keys '" << BINDING_ZONE << "' and '" << BINDING_SUBNET
        << "'), found " << el.size() << " keys";
      throw ConfigError( path, oss.str() );
    }
    SubnetBinding b;
    for ( const auto& [mk, mv] : el.map_items() ) {
      b.zone = key_string( mk );
      b.subnet_id = scalar_string( mv, child_path(path, b.zone), "subnet id" );
    }
    return b;
  }

  inline EnvironmentLayout build_environment( const ordered_node& bindings,
    const std::string& path )
  {
    if ( !bindings.is_sequence() ) {
      throw ConfigError( path, "subnets must be a list of availability zone"
        " bindings" );
    }
    if ( bindings.size() == 0 ) {
      throw ConfigError( path, "environment declares no availability zones" );
    }
    EnvironmentLayout layout;
    for ( std::size_t i = 0; i < bindings.size(); ++i ) {
      SubnetBinding b = parse_subnet_binding( bindings.at(i),
        seq_indexed(path, i) );
      if ( layout.subnets.count(b.zone) ) {
        throw ConfigError( seq_indexed(path, i), "availability zone '"
          + b.zone + "' is declared more than once" );
      }
      layout.zones.push_back( b.zone );
      layout.subnets.emplace( b.zone, b.subnet_id );
    }
    return layout;
  }

  inline EnvironmentMap build_environments( const ordered_node& subnets,
    const std::string& path )
  {
    EnvironmentMap envs;
    if ( subnets.is_null() ) return envs;
    require_mapping( subnets, path, "subnets" );
    for ( const auto& [mk, mv] : subnets.map_items() ) {
      const std::string env = key_string( mk );
      envs[ env ] = build_environment( mv, child_path(path, env) );
    }
    return envs;
  }

  // Network Interface Synthesizer

  inline bool is_ipv4_address( const std::string& s ) {
    int parts = 0;
    std::size_t start = 0;
    while ( true ) {
      std::size_t end = s.find( '.', start );
      const std::string part = s.substr( start,
        end == std::string::npos ? std::string::npos : end - start );
      if ( part.empty() || part.size() > 3 ) return false;
      for ( char c : part ) {
        if ( !std::isdigit(static_cast< unsigned char >(c)) ) return false;
      }
      if ( std::stoi(part) > 255 ) return false;
      ++parts;
      if ( end == std::string::npos ) break;
      start = end + 1;
    }
    return parts == 4;
  }

  // Either { interface_id: <id> } or { address: <ip> }. Plain strings are
  // accepted when unambiguous: a dotted-quad address, or an id with a hyphen
  inline InterfaceOverride parse_interface_override( const ordered_node& node,
    const std::string& path )
  {
    using Kind = InterfaceOverride::Kind;
    if ( node.is_mapping() ) {
      if ( node.size() == 1 && node.contains(OVERRIDE_INTERFACE_ID) ) {
        return { Kind::InterfaceId, scalar_string( node.at(OVERRIDE_INTERFACE_ID),
          child_path(path, OVERRIDE_INTERFACE_ID), "interface id" ) };
      }
      if ( node.size() == 1 && node.contains(OVERRIDE_ADDRESS) ) {
        return { Kind::Address, scalar_string( node.at(OVERRIDE_ADDRESS),
          child_path(path, OVERRIDE_ADDRESS), "address" ) };
      }
      throw ConfigError( path, "interface override must hold exactly one of '"
        + OVERRIDE_INTERFACE_ID + "' or '" + OVERRIDE_ADDRESS + "'" );
    }
    if ( node.is_string() ) {
      const std::string value = to_native_checked< std::string >( node );
      if ( is_ipv4_address(value) ) return { Kind::Address, value };
      if ( value.find('-') != std::string::npos ) {
        return { Kind::InterfaceId, value };
      }
      throw ConfigError( path, "cannot tell whether '" + value + "' is an"
        " interface id or an address; use '" + OVERRIDE_INTERFACE_ID
        + "' or '" + OVERRIDE_ADDRESS + "'" );
    }
    throw ConfigError( path, "interface override must be a string or a"
      " mapping" );
  }

  inline std::vector< InterfaceSpec > parse_interfaces( const ordered_node& node,
    const std::string& path )
  {
    if ( !node.is_sequence() || node.size() == 0 ) {
      throw ConfigError( path, "interfaces must be a non-empty list of"
        " environments" );
    }
    std::vector< InterfaceSpec > specs;
    for ( std::size_t i = 0; i < node.size(); ++i ) {
      const ordered_node& el = node.at( i );
      const std::string el_path = seq_indexed( path, i );
      InterfaceSpec spec;
      if ( is_non_null_scalar(el) ) {
        spec.environment = to_string_any( el );
      }
      else if ( el.is_mapping() && el.size() == 1 ) {
        for ( const auto& [mk, mv] : el.map_items() ) {
          spec.environment = key_string( mk );
          if ( mv.is_null() ) continue;
          require_mapping( mv, child_path(el_path, spec.environment),
            "per-zone interface overrides" );
          for ( const auto& [zk, zv] : mv.map_items() ) {
            const std::string zone = key_string( zk );
            spec.overrides.emplace( zone, parse_interface_override( zv,
              child_path(child_path(el_path, spec.environment), zone) ) );
          }
        }
      }
      else {
        throw ConfigError( el_path, "interface must be an environment name or"
          " a single-key mapping of an environment to per-zone overrides" );
      }
      specs.push_back( std::move(spec) );
    }
    return specs;
  }

  inline ordered_node make_network_interface( std::int64_t index,
    const std::string& subnet_id, const ordered_node& security_groups )
  {
    ordered_node iface = ordered_node::mapping();
    iface[ DEVICE_INDEX ] = make_node_from( index );
    iface[ SUBNET_ID ] = make_node_from( subnet_id );
    iface[ SECURITY_GROUP_ID ] = security_groups;
    return iface;
  }

  // Without specs, a single interface in the current environment. With
  // specs, one interface per entry, bound to the referenced environment's
  // subnet in the current zone
  inline ordered_node synthesize_interfaces(
    const std::optional< std::vector< InterfaceSpec > >& specs,
    const EnvironmentMap& envs, const std::string& env,
    const std::string& zone, const ordered_node& security_groups )
  {
    auto subnet_in = [&]( const std::string& name ) -> std::string {
      auto it = envs.find( name );
      if ( it == envs.end() ) {
        throw ReferenceError( "", "interface references environment '"
          + name + "', which the provider does not declare" );
      }
      auto subnet = it->second.subnet_for( zone );
      if ( !subnet ) {
        throw ReferenceError( "", "environment '" + name + "' has no subnet"
          " in availability zone '" + zone + "'" );
      }
      return *subnet;
    };

    std::vector< ordered_node > out;
    if ( !specs ) {
      out.push_back( make_network_interface(0, subnet_in(env),
        security_groups) );
      return make_node_from( out );
    }

    std::int64_t index = 0;
    for ( const auto& spec : *specs ) {
      ordered_node iface = make_network_interface( index,
        subnet_in(spec.environment), security_groups );
      auto ov = spec.overrides.find( zone );
      if ( ov != spec.overrides.end() ) {
        if ( ov->second.kind == InterfaceOverride::Kind::InterfaceId ) {
          iface[ NETWORK_INTERFACE_ID ] = make_node_from( ov->second.value );
        }
        else {
          iface[ PRIVATE_IP_ADDRESS ] = make_node_from( ov->second.value );
        }
      }
      out.push_back( iface );
      ++index;
    }
    return make_node_from( out );
  }

  // Role Resolver

  inline ordered_node merge_layers( const std::vector< RoleLayer >& layers ) {
    ordered_node merged = ordered_node::mapping();
    for ( const auto& layer : layers ) {
      if ( layer.fields.is_null() ) continue;
      require_mapping( layer.fields, layer.origin, "role attributes" );
      merged = deep_merge( merged, layer.fields );
    }
    return drop_nulls( merged );
  }

  // security_groups becomes a list that always ends with the common groups,
  // each present exactly once
  inline void normalize_security_groups( ordered_node& fields,
    const std::vector< std::string >& common )
  {
    std::vector< ordered_node > groups;
    if ( fields.contains(SECURITY_GROUPS) ) {
      const ordered_node& sg = fields.at( SECURITY_GROUPS );
      if ( sg.is_sequence() ) {
        for ( const auto& g : sg ) {
          if ( !is_non_null_scalar(g) ) {
            throw ConfigError( "", "security_groups entries must be ids" );
          }
          groups.push_back( g );
        }
      }
      else if ( is_non_null_scalar(sg) ) {
        groups.push_back( sg );
      }
      else {
        throw ConfigError( "", "security_groups must be an id or a list of"
          " ids" );
      }
    }

    std::vector< ordered_node > kept;
    for ( const auto& g : groups ) {
      const std::string id = to_string_any( g );
      if ( std::find(common.begin(), common.end(), id) != common.end() ) {
        continue;
      }
      kept.push_back( g );
    }
    for ( const auto& id : common ) kept.push_back( make_node_from(id) );
    fields[ SECURITY_GROUPS ] = make_node_from( kept );
  }

  // Default tags never overwrite authored ones; VolumeType follows "type"
  inline void tag_volumes( ordered_node& fields, const std::string& env,
    const std::string& role )
  {
    if ( !fields.contains(VOLUMES) ) return;
    const ordered_node& volumes = fields.at( VOLUMES );
    if ( !volumes.is_sequence() ) {
      throw ConfigError( "", "volumes must be a list of volume specs" );
    }

    const std::vector< std::pair< std::string, std::string > > defaults = {
      { TAG_ENVIRONMENT, env }, { TAG_ROLE, role },
      { TAG_SERVICE, EBS_SERVICE }
    };

    std::vector< ordered_node > tagged;
    for ( std::size_t i = 0; i < volumes.size(); ++i ) {
      ordered_node vol = volumes.at( i );
      if ( !vol.is_mapping() ) {
        throw ConfigError( "", "volume " + std::to_string(i)
          + " must be a mapping" );
      }
      ordered_node tags = ordered_node::mapping();
      if ( vol.contains(TAGS) ) {
        tags = vol.at( TAGS );
        if ( !tags.is_mapping() ) {
          throw ConfigError( "", "tags of volume " + std::to_string(i)
            + " must be a mapping" );
        }
      }
      for ( const auto& [key, value] : defaults ) {
        if ( !tags.contains(key) ) tags[ key ] = make_node_from( value );
      }
      if ( vol.contains(TYPE) ) {
        tags[ TAG_VOLUME_TYPE ] = make_node_from( to_string_any(vol.at(TYPE)) );
      }
      vol[ TAGS ] = tags;
      tagged.push_back( vol );
    }
    fields[ VOLUMES ] = make_node_from( tagged );
  }

  // Fold the layers, normalize and tag, then check the required fields.
  // A role without any security group counts as lacking security_groups
  inline RoleResolution resolve_role( const std::string& role,
    const std::string& env, const std::vector< RoleLayer >& layers,
    const std::vector< std::string >& common_groups )
  {
    RoleResolution res;
    res.fields = merge_layers( layers );
    normalize_security_groups( res.fields, common_groups );
    tag_volumes( res.fields, env, role );

    const std::vector< std::string > required = { SIZE, IMAGE };
    for ( const auto& key : required ) {
      if ( !res.fields.contains(key) ) res.missing.push_back( key );
    }
    if ( res.fields.at(SECURITY_GROUPS).size() == 0 ) {
      res.missing.push_back( SECURITY_GROUPS );
    }
    return res;
  }

  // Profile naming and hostname templates

  inline std::string profile_name( const std::string& role,
    const std::string& env, const std::string& provider,
    const std::string& zone )
  {
    return role + '_' + env + '_' + provider + zone;
  }

  // <role>%02d.<environment>.<provider>.<domain>
  inline std::string hostname_template( const std::string& role,
    const std::string& env, const std::string& provider,
    const std::string& domain )
  {
    return role + ORDINAL_PLACEHOLDER + PATH_DELIMITER + env + PATH_DELIMITER
      + provider + PATH_DELIMITER + domain;
  }

  // Ordinals are zero-padded to two digits; larger counts widen the field
  inline std::string format_hostname( const std::string& tmpl,
    std::int64_t ordinal )
  {
    const std::size_t pos = tmpl.find( ORDINAL_PLACEHOLDER );
    if ( pos == std::string::npos
      || tmpl.find(ORDINAL_PLACEHOLDER, pos + 1) != std::string::npos )
    {
      throw ConfigError( "", "hostname template '" + tmpl + "' must contain"
        " exactly one '" + ORDINAL_PLACEHOLDER + "' placeholder" );
    }
    std::ostringstream oss;
    oss << tmpl.substr( 0, pos ) << std::setw( 2 ) << std::setfill( '0' )
      << ordinal << tmpl.substr( pos + ORDINAL_PLACEHOLDER.size() );
    return oss.str();
  }

  // Hostname Distributor

  // Move one zone, drawn from a generator seeded with the template, to the
  // front. The draw depends only on the template and the zone count
  inline std::vector< std::string > cycle_order( const std::string& seed,
    std::vector< std::string > zones )
  {
    if ( zones.size() < 2 ) return zones;
    std::vector< std::uint32_t > seed_data;
    seed_data.reserve( seed.size() );
    for ( char c : seed ) {
      seed_data.push_back( static_cast< unsigned char >(c) );
    }
    std::seed_seq seq( seed_data.begin(), seed_data.end() );
    std::mt19937 gen( seq );

    const std::size_t pick = static_cast< std::size_t >( gen() % zones.size() );
    std::string first = zones[ pick ];
    zones.erase( zones.begin() + static_cast< std::ptrdiff_t >(pick) );
    zones.insert( zones.begin(), first );
    return zones;
  }

  // Assign ordinals 1..count round-robin over the seeded zone order.
  // Returns profile name -> { hostname -> host defaults }
  inline ordered_node distribute_hostnames(
    const std::vector< std::pair< std::string, std::string > >& zone_profiles,
    std::int64_t count, const std::string& tmpl,
    const ordered_node& host_defaults )
  {
    ordered_node assigned = ordered_node::mapping();
    if ( count <= 0 ) return assigned;
    if ( zone_profiles.empty() ) {
      throw ConfigError( "", "cannot place hosts without availability zones" );
    }

    // Surface a bad template before anything is assigned
    format_hostname( tmpl, 1 );

    std::vector< std::string > zones;
    std::unordered_map< std::string, std::string > profile_of;
    for ( const auto& [zone, profile] : zone_profiles ) {
      zones.push_back( zone );
      profile_of.emplace( zone, profile );
    }
    const std::vector< std::string > order = cycle_order( tmpl, zones );

    for ( std::int64_t i = 1; i <= count; ++i ) {
      const std::size_t slot = static_cast< std::size_t >( i - 1 )
        % order.size();
      const std::string& profile = profile_of.at( order[slot] );
      if ( !assigned.contains(profile) ) {
        assigned[ profile ] = ordered_node::mapping();
      }
      assigned[ profile ][ format_hostname(tmpl, i) ] = host_defaults;
    }
    return assigned;
  }

  // Input loading

  inline ordered_node parse_document( const std::string& text ) {
    ordered_node doc = ordered_node::deserialize( text );
    reject_anchors_and_aliases( doc, {} );
    return doc;
  }

  inline ordered_node read_document( std::istream& in ) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_document( ss.str() );
  }

  // Later documents win, with the same rules as role layers
  inline ordered_node layer_documents( const std::vector< ordered_node >& docs ) {
    ordered_node merged = ordered_node::mapping();
    for ( const auto& doc : docs ) {
      if ( doc.is_null() ) continue;
      require_mapping( doc, "", "input document" );
      merged = deep_merge( merged, doc );
    }
    return drop_nulls( merged );
  }

} // namespace stratus::internal

  // Print diagnostics as "[stratus] <severity>: <path>: <message>". Info
  // records are only printed when verbose
  inline void write_diagnostics( std::ostream& os, const Expansion& expansion,
    bool verbose = false )
  {
    for ( const auto& d : expansion.diagnostics ) {
      if ( d.severity == Severity::Info && !verbose ) continue;
      os << "[stratus] " << severity_name( d.severity ) << ": ";
      if ( !d.path.empty() ) os << d.path << ": ";
      os << d.message << '\n';
    }
  }

} // namespace stratus

inline std::size_t stratus::Expansion::count( Severity severity ) const {
  return static_cast< std::size_t >( std::count_if( diagnostics.begin(),
    diagnostics.end(),
    [&]( const Diagnostic& d ) { return d.severity == severity; } ) );
}

inline std::optional< std::string > stratus::EnvironmentLayout::subnet_for(
  const std::string& zone ) const
{
  auto it = subnets.find( zone );
  if ( it == subnets.end() ) return std::nullopt;
  return it->second;
}

// Expander member function definitions

inline stratus::Expansion stratus::Expander::expand(
  const ordered_node& providers, const ordered_node& servers,
  const ordered_node& defaults )
{
  // Rebuild default session state for this call
  session_ = ExpandSession();
  session_.domain = options_.domain;

  try {
    // 1) Global defaults for providers, profiles and map entries
    this->load_defaults( defaults );

    // 2) Environment Builder and provider role layers, one provider at a time
    this->load_providers( providers );

    // 3) Profiles and host assignments for the sparse server list
    this->expand_servers( servers );
  }
  catch ( const Error& err ) {
    // Only top-level shape problems reach this point; nothing partial is kept
    session_.out.providers = ordered_node::mapping();
    session_.out.profiles = ordered_node::mapping();
    session_.out.maps = ordered_node::mapping();
    this->note( Severity::Error, err, "" );
  }
  catch ( const fkyaml::exception& ex ) {
    session_.out.providers = ordered_node::mapping();
    session_.out.profiles = ordered_node::mapping();
    session_.out.maps = ordered_node::mapping();
    this->note( Severity::Error, "", ex.what() );
  }
  catch ( const std::exception& ex ) {
    session_.out.providers = ordered_node::mapping();
    session_.out.profiles = ordered_node::mapping();
    session_.out.maps = ordered_node::mapping();
    this->note( Severity::Error, "", std::string("expansion aborted: ")
      + ex.what() );
  }

  return session_.out;
}

inline stratus::Expansion stratus::Expander::expand(
  const ordered_node& document )
{
  auto fail = [&]( const std::string& msg ) {
    Expansion out;
    out.diagnostics.push_back( { Severity::Error, "", msg } );
    return out;
  };

  if ( !document.is_mapping() ) {
    return fail( "input document must be a mapping holding '"
      + options_.providers_key + "', '" + options_.servers_key
      + "' and '" + options_.defaults_key + "'" );
  }
  for ( const auto& key : { options_.providers_key, options_.servers_key } ) {
    if ( !document.contains(key) ) {
      return fail( "input document has no '" + key + "' section" );
    }
  }

  const ordered_node defaults = document.contains( options_.defaults_key )
    ? document.at( options_.defaults_key ) : ordered_node();
  return this->expand( document.at(options_.providers_key),
    document.at(options_.servers_key), defaults );
}

inline stratus::Expansion stratus::Expander::expand( std::istream& in ) {
  ordered_node document;
  try {
    document = internal::read_document( in );
  }
  catch ( const Error& err ) {
    Expansion out;
    out.diagnostics.push_back( { Severity::Error, err.path(), err.detail() } );
    return out;
  }
  catch ( const fkyaml::exception& ex ) {
    Expansion out;
    out.diagnostics.push_back( { Severity::Error, "", ex.what() } );
    return out;
  }
  return this->expand( document );
}

inline void stratus::Expander::note( Severity severity,
  const std::string& path, const std::string& message )
{
  session_.out.diagnostics.push_back( { severity, path, message } );
}

inline void stratus::Expander::note( Severity severity, const Error& err,
  const std::string& fallback_path )
{
  this->note( severity, err.path().empty() ? fallback_path : err.path(),
    err.detail() );
}

inline void stratus::Expander::load_defaults( const ordered_node& defaults ) {
  using namespace internal;

  session_.provider_defaults = ordered_node::mapping();
  session_.role_defaults = ordered_node::mapping();
  session_.host_defaults = ordered_node::mapping();
  if ( defaults.is_null() ) return;

  const std::string& root = options_.defaults_key;
  require_mapping( defaults, root, "defaults" );

  auto section = [&]( const std::string& key ) -> ordered_node {
    if ( !defaults.contains(key) || defaults.at(key).is_null() ) {
      return ordered_node::mapping();
    }
    require_mapping( defaults.at(key), child_path(root, key),
      "defaults section" );
    return defaults.at( key );
  };

  session_.provider_defaults = section( PROVIDER_DEFAULTS );
  session_.role_defaults = section( PROFILE_DEFAULTS );
  session_.host_defaults = section( MAPPING_DEFAULTS );

  const ordered_node hostnames = section( HOSTNAME_DEFAULTS );
  if ( hostnames.contains(DOMAIN) ) {
    session_.domain = scalar_string( hostnames.at(DOMAIN),
      child_path(child_path(root, HOSTNAME_DEFAULTS), DOMAIN), "domain" );
  }
}

inline void stratus::Expander::load_providers( const ordered_node& providers ) {
  using namespace internal;

  const std::string& root = options_.providers_key;
  require_mapping( providers, root, "providers" );

  for ( const auto& [name, decl] : sorted_items(providers) ) {
    const std::string path = child_path( root, name );
    try {
      ProviderModel model = this->load_provider( name, decl );

      std::vector< std::string > envs;
      for ( const auto& kv : model.environments ) envs.push_back( kv.first );
      this->note( Severity::Info, path, "Environments: " + join_names(envs) );

      session_.out.providers[ name ] = model.config;
      session_.providers.emplace( name, std::move(model) );
    }
    catch ( const Error& err ) {
      // A provider with a malformed declaration contributes nothing
      session_.failed_providers.insert( name );
      this->note( Severity::Error, err, path );
    }
  }
}

inline stratus::ProviderModel stratus::Expander::load_provider(
  const std::string& name, const ordered_node& decl )
{
  using namespace internal;

  const std::string path = child_path( options_.providers_key, name );
  require_mapping( decl, path, "provider declaration" );

  ProviderModel model;
  model.name = name;

  if ( decl.contains(SUBNETS) ) {
    model.environments = build_environments( decl.at(SUBNETS),
      child_path(path, SUBNETS) );
  }

  // Per-role attribute mappings: section -> role field
  const std::vector< std::pair< std::string, std::string > > attributes = {
    { SIZES, SIZE }, { IMAGES, IMAGE }, { VOLUMES, VOLUMES },
    { SECURITY_GROUPS, SECURITY_GROUPS }
  };
  for ( const auto& [section, field] : attributes ) {
    if ( !decl.contains(section) || decl.at(section).is_null() ) continue;
    const ordered_node& per_role = decl.at( section );
    const std::string section_path = child_path( path, section );
    require_mapping( per_role, section_path, section );

    for ( const auto& [mk, mv] : per_role.map_items() ) {
      const std::string role = key_string( mk );
      if ( section == SECURITY_GROUPS && role == COMMON_GROUP ) {
        model.common_groups = parse_group_ids( mv,
          child_path(section_path, role) );
        continue;
      }
      auto it = model.roles.find( role );
      if ( it == model.roles.end() ) {
        it = model.roles.emplace( role, ordered_node::mapping() ).first;
      }
      it->second[ field ] = mv;
    }
  }

  // Everything not consumed above passes through, over the provider defaults
  model.config = drop_nulls( deep_merge( session_.provider_defaults,
    without_keys(decl, { SUBNETS, SIZES, IMAGES, VOLUMES, SECURITY_GROUPS }) ) );

  if ( !model.config.contains(DEFAULT_SERVERS) ) {
    throw ConfigError( path, "default_servers is declared neither by the"
      " provider nor by the provider defaults" );
  }
  model.default_servers = parse_count( model.config.at(DEFAULT_SERVERS),
    child_path(path, DEFAULT_SERVERS) );
  model.config = without_keys( model.config, { DEFAULT_SERVERS } );

  return model;
}

inline void stratus::Expander::expand_servers( const ordered_node& servers ) {
  using namespace internal;

  const std::string& root = options_.servers_key;
  require_mapping( servers, root, "server assignments" );

  for ( const auto& [pname, envs] : sorted_items(servers) ) {
    const std::string path = child_path( root, pname );

    if ( session_.failed_providers.count(pname) ) {
      this->note( Severity::Info, path, "Skipping provider '" + pname
        + "', whose declaration failed to load" );
      continue;
    }
    auto it = session_.providers.find( pname );
    if ( it == session_.providers.end() ) {
      std::vector< std::string > known;
      for ( const auto& kv : session_.providers ) known.push_back( kv.first );
      this->note( Severity::Warning, path, "No provider named '" + pname
        + "'; known providers: " + join_names(known) );
      continue;
    }
    const ProviderModel& provider = it->second;

    if ( envs.is_null() ) continue;
    if ( !envs.is_mapping() ) {
      this->note( Severity::Error, path, "server assignments must map"
        " environments to role lists" );
      continue;
    }

    for ( const auto& [ename, roles] : sorted_items(envs) ) {
      const std::string env_path = child_path( path, ename );

      if ( !provider.environments.count(ename) ) {
        std::vector< std::string > known;
        for ( const auto& kv : provider.environments ) {
          known.push_back( kv.first );
        }
        this->note( Severity::Warning, env_path, "No environment named '"
          + ename + "' in provider '" + pname + "'; known environments: "
          + join_names(known) );
        continue;
      }
      if ( roles.is_null() ) continue;
      if ( !roles.is_sequence() ) {
        this->note( Severity::Error, env_path, "roles must be a list" );
        continue;
      }

      for ( std::size_t i = 0; i < roles.size(); ++i ) {
        const std::string entry_path = seq_indexed( env_path, i );
        try {
          this->expand_role( provider, ename, roles.at(i), entry_path );
        }
        catch ( const ConfigError& err ) {
          this->note( Severity::Error, err, entry_path );
        }
        catch ( const ReferenceError& err ) {
          this->note( Severity::Warning, err, entry_path );
        }
      }
    }
  }
}

inline std::vector< stratus::RoleLayer > stratus::Expander::layers_for(
  const ProviderModel& provider, const std::string& role,
  const ordered_node& overrides, const std::string& path ) const
{
  using namespace internal;

  // Global defaults -> provider default -> provider role -> instance override
  std::vector< RoleLayer > layers;
  layers.push_back( { child_path(options_.defaults_key, PROFILE_DEFAULTS),
    session_.role_defaults } );

  const std::string provider_path = child_path( options_.providers_key,
    provider.name );
  if ( role != DEFAULT_ROLE ) {
    auto it = provider.roles.find( DEFAULT_ROLE );
    if ( it != provider.roles.end() ) {
      layers.push_back( { child_path(provider_path, DEFAULT_ROLE),
        it->second } );
    }
  }
  auto it = provider.roles.find( role );
  if ( it != provider.roles.end() ) {
    layers.push_back( { child_path(provider_path, role), it->second } );
  }
  if ( !overrides.is_null() ) {
    layers.push_back( { path, overrides } );
  }
  return layers;
}

inline void stratus::Expander::expand_role( const ProviderModel& provider,
  const std::string& env, const ordered_node& entry, const std::string& path )
{
  using namespace internal;

  // A role entry is a bare name or a single-key { name: overrides }
  std::string role;
  ordered_node overrides;
  if ( is_non_null_scalar(entry) ) {
    role = to_string_any( entry );
  }
  else if ( entry.is_mapping() && entry.size() == 1 ) {
    for ( const auto& [mk, mv] : entry.map_items() ) {
      role = key_string( mk );
      overrides = mv;
    }
    if ( !overrides.is_null() && !overrides.is_mapping() ) {
      throw ConfigError( path, "overrides of role '" + role
        + "' must be a mapping" );
    }
  }
  else {
    throw ConfigError( path, "role entry must be a role name or a single-key"
      " mapping of a role name to its overrides" );
  }

  this->note( Severity::Info, path, "Updating profile " + role + "..." );

  const RoleResolution resolution = resolve_role( role, env,
    this->layers_for(provider, role, overrides, path),
    provider.common_groups );
  if ( !resolution.complete() ) {
    this->note( Severity::Warning, path, "Role '" + role + "' does not define "
      + join_names(resolution.missing) + "; it only has "
      + describe_fields(resolution.fields) );
    return;
  }
  const ordered_node& fields = resolution.fields;

  std::int64_t count = provider.default_servers;
  if ( fields.contains(SERVERS) ) {
    count = parse_count( fields.at(SERVERS), child_path(path, SERVERS) );
  }

  std::optional< std::vector< InterfaceSpec > > interfaces;
  if ( fields.contains(INTERFACES) ) {
    interfaces = parse_interfaces( fields.at(INTERFACES),
      child_path(path, INTERFACES) );
  }

  // Working-only fields never reach the profile
  const ordered_node base = without_keys( fields,
    { SECURITY_GROUPS, SERVERS, INTERFACES } );
  ordered_node tag = ordered_node::mapping();
  tag[ TAG_ENVIRONMENT ] = make_node_from( env );
  tag[ TAG_ROLE ] = make_node_from( role );

  ordered_node env_profiles = session_.out.profiles.contains( env )
    ? session_.out.profiles.at( env ) : ordered_node::mapping();

  // Build every zone's profile before committing any of them
  const EnvironmentLayout& layout = provider.environments.at( env );
  std::vector< std::pair< std::string, ordered_node > > built;
  std::vector< std::pair< std::string, std::string > > zone_profiles;
  for ( const auto& zone : layout.zones ) {
    const std::string name = profile_name( role, env, provider.name, zone );
    if ( env_profiles.contains(name) ) {
      this->note( Severity::Warning, path, "Profile '" + name + "' is already"
        " defined in environment '" + env + "'; skipping role '" + role
        + "'" );
      return;
    }

    ordered_node profile = base;
    profile[ PROVIDER ] = make_node_from( provider.name );
    profile[ TAG ] = tag;
    profile[ NETWORK_INTERFACES ] = synthesize_interfaces( interfaces,
      provider.environments, env, zone, fields.at(SECURITY_GROUPS) );

    built.emplace_back( name, profile );
    zone_profiles.emplace_back( zone, name );
  }

  const std::string tmpl = hostname_template( role, env, provider.name,
    session_.domain );
  const ordered_node assigned = distribute_hostnames( zone_profiles, count,
    tmpl, session_.host_defaults );

  for ( const auto& [name, profile] : built ) env_profiles[ name ] = profile;
  session_.out.profiles[ env ] = env_profiles;

  if ( assigned.size() > 0 ) {
    ordered_node env_maps = session_.out.maps.contains( env )
      ? session_.out.maps.at( env ) : ordered_node::mapping();
    for ( const auto& [mk, mv] : assigned.map_items() ) {
      env_maps[ key_string(mk) ] = mv;
    }
    session_.out.maps[ env ] = env_maps;
  }
}

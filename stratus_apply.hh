// ┏━┓╺┳╸┏━┓┏━┓╺┳╸╻ ╻┏━┓
// ┗━┓ ┃ ┣┳┛┣━┫ ┃ ┃ ┃┗━┓
// ┗━┛ ╹ ╹┗╸╹ ╹ ╹ ┗━┛┗━┛
//  Layered cloud map expansion for salt-cloud
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the stratus developers
#pragma once

// Standard library includes
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

// POSIX ownership lookups and file creation
#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "stratus.hh"

namespace stratus {

  namespace fs = std::filesystem;

  enum class FileChange { Created, Updated, Unchanged, Failed };

  inline const char* change_name( FileChange change ) {
    switch ( change ) {
      case FileChange::Created: return "created";
      case FileChange::Updated: return "updated";
      case FileChange::Unchanged: return "unchanged";
      case FileChange::Failed: return "failed";
    }
    return "unknown";
  }

  // Outcome for one directory or file managed by the Applier
  struct FileRecord {
    fs::path path;
    FileChange change;
    std::string comment;
  };

  struct ApplyOptions {
    // Base salt configuration directory
    fs::path conf_dir = "/etc/salt";

    fs::perms file_mode = static_cast< fs::perms >( 0600 );
    fs::perms dir_mode = static_cast< fs::perms >( 0700 );

    // Owner applied to managed paths when set
    std::optional< std::string > user;
    std::optional< std::string > group;

    // Report what would change without touching the filesystem
    bool test = false;
  };

  struct ApplyReport {
    std::vector< FileRecord > records;

    // True when every directory and file was processed
    bool result = true;

    inline std::size_t count( FileChange change ) const;
  };

  // Writes the three output trees of an Expansion below conf_dir:
  //   cloud.providers.d/<provider>.conf  { <provider>: config }
  //   cloud.profiles.d/<environment>.conf  profile name -> profile
  //   cloud.maps/<environment>  profile name -> hostname -> host defaults
  class Applier {
  public:
    inline static const std::string PROVIDER_DIR = "cloud.providers.d";
    inline static const std::string PROFILE_DIR = "cloud.profiles.d";
    inline static const std::string MAP_DIR = "cloud.maps";
    inline static const std::string CONF_SUFFIX = ".conf";

    inline explicit Applier( ApplyOptions options )
      : options_( std::move(options) ) {}

    // Throws std::runtime_error when the configured user or group is unknown.
    // Per-file problems are recorded as FileChange::Failed instead
    ApplyReport apply( const Expansion& expansion );

    // YAML text written for one output tree
    static std::string render( const ordered_node& tree );

    // A tree key usable as a file name
    static bool is_valid_file_name( const std::string& name );

  private:

    ApplyOptions options_;
    uid_t uid_ = static_cast< uid_t >( -1 );
    gid_t gid_ = static_cast< gid_t >( -1 );

    void resolve_ownership();
    void apply_ownership( const fs::path& path ) const;
    bool ownership_differs( const fs::path& path ) const;

    void ensure_directory( const fs::path& dir, ApplyReport& report );
    void manage_file( const fs::path& dir, const std::string& name,
      const ordered_node& tree, ApplyReport& report );
    void write_file( const fs::path& file, const std::string& contents ) const;

  }; // class Applier

} // namespace stratus

inline std::size_t stratus::ApplyReport::count( FileChange change ) const {
  std::size_t n = 0;
  for ( const auto& r : records ) {
    if ( r.change == change ) ++n;
  }
  return n;
}

inline std::string stratus::Applier::render( const ordered_node& tree ) {
  return ordered_node::serialize( tree );
}

inline bool stratus::Applier::is_valid_file_name( const std::string& name ) {
  if ( name.empty() || name == "." || name == ".." ) return false;
  return name.find( '/' ) == std::string::npos
    && name.find( '\0' ) == std::string::npos;
}

inline stratus::ApplyReport stratus::Applier::apply(
  const Expansion& expansion )
{
  this->resolve_ownership();

  ApplyReport report;
  const fs::path provider_dir = options_.conf_dir / PROVIDER_DIR;
  const fs::path profile_dir = options_.conf_dir / PROFILE_DIR;
  const fs::path map_dir = options_.conf_dir / MAP_DIR;

  this->ensure_directory( provider_dir, report );
  this->ensure_directory( profile_dir, report );
  this->ensure_directory( map_dir, report );

  // Provider files keep the provider name as their top-level key
  for ( const auto& [mk, mv] : expansion.providers.map_items() ) {
    const std::string name = internal::key_string( mk );
    ordered_node wrapped = ordered_node::mapping();
    wrapped[ name ] = mv;
    this->manage_file( provider_dir, name + CONF_SUFFIX, wrapped, report );
  }
  for ( const auto& [mk, mv] : expansion.profiles.map_items() ) {
    this->manage_file( profile_dir, internal::key_string(mk) + CONF_SUFFIX,
      mv, report );
  }
  for ( const auto& [mk, mv] : expansion.maps.map_items() ) {
    this->manage_file( map_dir, internal::key_string(mk), mv, report );
  }

  return report;
}

inline void stratus::Applier::resolve_ownership() {
  uid_ = static_cast< uid_t >( -1 );
  gid_ = static_cast< gid_t >( -1 );

  if ( options_.user ) {
    const struct passwd* pw = ::getpwnam( options_.user->c_str() );
    if ( pw == nullptr ) {
      throw std::runtime_error( "Unknown user '" + *options_.user + "'" );
    }
    uid_ = pw->pw_uid;
  }
  if ( options_.group ) {
    const struct group* gr = ::getgrnam( options_.group->c_str() );
    if ( gr == nullptr ) {
      throw std::runtime_error( "Unknown group '" + *options_.group + "'" );
    }
    gid_ = gr->gr_gid;
  }
}

inline void stratus::Applier::apply_ownership( const fs::path& path ) const {
  if ( !options_.user && !options_.group ) return;
  if ( ::chown(path.c_str(), uid_, gid_) != 0 ) {
    throw std::system_error( errno, std::generic_category(),
      "chown " + path.string() );
  }
}

// True when a configured user or group does not own the path
inline bool stratus::Applier::ownership_differs( const fs::path& path ) const
{
  if ( !options_.user && !options_.group ) return false;
  struct stat st;
  if ( ::stat(path.c_str(), &st) != 0 ) {
    throw std::system_error( errno, std::generic_category(),
      "stat " + path.string() );
  }
  if ( options_.user && st.st_uid != uid_ ) return true;
  if ( options_.group && st.st_gid != gid_ ) return true;
  return false;
}

inline void stratus::Applier::ensure_directory( const fs::path& dir,
  ApplyReport& report )
{
  try {
    if ( !fs::exists(dir) ) {
      if ( !options_.test ) {
        fs::create_directories( dir );
        fs::permissions( dir, options_.dir_mode, fs::perm_options::replace );
        this->apply_ownership( dir );
      }
      report.records.push_back( { dir, FileChange::Created,
        options_.test ? "Directory would be created" : "Directory created" } );
      return;
    }
    if ( !fs::is_directory(dir) ) {
      report.records.push_back( { dir, FileChange::Failed,
        "Path exists and is not a directory" } );
      report.result = false;
      return;
    }

    const fs::perms current = fs::status( dir ).permissions() & fs::perms::mask;
    const bool mode_differs = current != options_.dir_mode;
    const bool owner_differs = this->ownership_differs( dir );
    if ( !mode_differs && !owner_differs ) {
      report.records.push_back( { dir, FileChange::Unchanged, "" } );
      return;
    }
    if ( !options_.test ) {
      fs::permissions( dir, options_.dir_mode, fs::perm_options::replace );
      this->apply_ownership( dir );
    }
    std::string what = mode_differs ? "Mode" : "Ownership";
    if ( mode_differs && owner_differs ) what = "Mode and ownership";
    report.records.push_back( { dir, FileChange::Updated,
      what + ( options_.test ? " would be updated" : " updated" ) } );
  }
  catch ( const std::system_error& ex ) {
    report.records.push_back( { dir, FileChange::Failed, ex.what() } );
    report.result = false;
  }
}

inline void stratus::Applier::manage_file( const fs::path& dir,
  const std::string& name, const ordered_node& tree, ApplyReport& report )
{
  if ( !is_valid_file_name(name) ) {
    report.records.push_back( { dir / name, FileChange::Failed,
      "'" + name + "' is not a valid file name" } );
    report.result = false;
    return;
  }

  const fs::path file = dir / name;
  const std::string contents = render( tree );

  try {
    FileChange change = FileChange::Created;
    if ( fs::exists(file) ) {
      std::ifstream in( file, std::ios::binary );
      if ( !in ) {
        throw std::runtime_error( "Unable to read " + file.string() );
      }
      std::ostringstream prior;
      prior << in.rdbuf();

      const fs::perms mode = fs::status( file ).permissions() & fs::perms::mask;
      if ( prior.str() == contents && mode == options_.file_mode
        && !this->ownership_differs(file) )
      {
        report.records.push_back( { file, FileChange::Unchanged, "" } );
        return;
      }
      change = FileChange::Updated;
    }

    if ( !options_.test ) this->write_file( file, contents );

    std::string comment;
    if ( options_.test ) {
      comment = change == FileChange::Created ? "File would be created"
        : "File would be updated";
    }
    report.records.push_back( { file, change, comment } );
  }
  catch ( const std::exception& ex ) {
    report.records.push_back( { file, FileChange::Failed, ex.what() } );
    report.result = false;
  }
}

// Write next to the target, then rename over it, so readers never see a
// partially written file. The temporary file is created with file_mode
// before any contents are written
inline void stratus::Applier::write_file( const fs::path& file,
  const std::string& contents ) const
{
  const fs::path tmp = file.parent_path()
    / ( "." + file.filename().string() + ".stratus-tmp" );

  // A leftover from an interrupted run may carry another mode or owner
  std::error_code stale;
  fs::remove( tmp, stale );

  const mode_t mode = static_cast< mode_t >( options_.file_mode );
  const int fd = ::open( tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
    mode );
  if ( fd < 0 ) {
    throw std::system_error( errno, std::generic_category(),
      "create " + tmp.string() );
  }
  // The umask may have narrowed the creation mode
  if ( ::fchmod(fd, mode) != 0 ) {
    const int err = errno;
    ::close( fd );
    fs::remove( tmp, stale );
    throw std::system_error( err, std::generic_category(),
      "chmod " + tmp.string() );
  }
  ::close( fd );

  try {
    {
      std::ofstream out( tmp, std::ios::binary | std::ios::trunc );
      if ( !out ) {
        throw std::runtime_error( "Unable to open " + tmp.string()
          + " for writing" );
      }
      out << contents;
      out.close();
      if ( !out ) {
        throw std::runtime_error( "Unable to write " + tmp.string() );
      }
    }
    this->apply_ownership( tmp );
    fs::rename( tmp, file );
  }
  catch ( const std::exception& ) {
    std::error_code ignored;
    fs::remove( tmp, ignored );
    throw;
  }
}

#include "stratus.hh"
#include "stratus_apply.hh"

#include <fstream>
#include <string_view>

namespace {

  struct Args {
    std::vector< std::string > inputs;
    stratus::ExpanderOptions expander;
    stratus::ApplyOptions apply;
    bool print = false;
    bool allow_partial = false;
    bool verbose = false;
    bool help = false;
  };

  void print_usage( const char* argv0 ) {
    std::cerr
      << "stratus: expand a cloud description into salt-cloud providers,"
      << " profiles and maps\n"
      << "Usage:\n"
      << "  " << argv0 << " [options] <input.yaml> [<input.yaml> ...]\n"
      << "\n"
      << "Inputs are layered in order (later files win); '-' reads stdin.\n"
      << "\n"
      << "Options:\n"
      << "  --conf-dir <dir>        Salt config directory (default: /etc/salt)\n"
      << "  --providers-key <key>   Top-level key of the providers tree\n"
      << "  --servers-key <key>     Top-level key of the server assignments\n"
      << "  --defaults-key <key>    Top-level key of the defaults tree\n"
      << "  --file-mode <octal>     Mode of written files (default: 0600)\n"
      << "  --dir-mode <octal>      Mode of created directories (default: 0700)\n"
      << "  --user <name>           Owner of written paths\n"
      << "  --group <name>          Group of written paths\n"
      << "  --test                  Report changes without writing\n"
      << "  --print                 Print the three trees instead of writing\n"
      << "  --allow-partial         Write even when errors were reported\n"
      << "  --verbose               Also print info diagnostics\n"
      << "  -h, --help              Show this help message\n"
      << std::endl;
  }

  std::filesystem::perms parse_mode( std::string_view flag,
    const std::string& text )
  {
    std::size_t used = 0;
    unsigned long mode = 0;
    try {
      mode = std::stoul( text, &used, 8 );
    }
    catch ( const std::logic_error& ) {
      used = 0;
    }
    if ( used != text.size() || text.empty() || mode > 07777 ) {
      throw std::runtime_error( std::string(flag) + " expects an octal mode,"
        " found '" + text + "'" );
    }
    return static_cast< std::filesystem::perms >( mode );
  }

  Args parse_args( int argc, char** argv ) {
    Args args;
    auto value = [&]( int& i, std::string_view flag ) -> std::string {
      if ( i + 1 >= argc ) {
        throw std::runtime_error( std::string(flag) + " expects a value" );
      }
      return argv[ ++i ];
    };

    for ( int i = 1; i < argc; ++i ) {
      std::string_view tok = argv[ i ];
      if ( tok == "-h" || tok == "--help" ) {
        args.help = true;
        break;
      }
      else if ( tok == "--conf-dir" ) {
        args.apply.conf_dir = value( i, tok );
      }
      else if ( tok == "--providers-key" ) {
        args.expander.providers_key = value( i, tok );
      }
      else if ( tok == "--servers-key" ) {
        args.expander.servers_key = value( i, tok );
      }
      else if ( tok == "--defaults-key" ) {
        args.expander.defaults_key = value( i, tok );
      }
      else if ( tok == "--file-mode" ) {
        args.apply.file_mode = parse_mode( tok, value(i, tok) );
      }
      else if ( tok == "--dir-mode" ) {
        args.apply.dir_mode = parse_mode( tok, value(i, tok) );
      }
      else if ( tok == "--user" ) {
        args.apply.user = value( i, tok );
      }
      else if ( tok == "--group" ) {
        args.apply.group = value( i, tok );
      }
      else if ( tok == "--test" ) {
        args.apply.test = true;
      }
      else if ( tok == "--print" ) {
        args.print = true;
      }
      else if ( tok == "--allow-partial" ) {
        args.allow_partial = true;
      }
      else if ( tok == "--verbose" ) {
        args.verbose = true;
      }
      else if ( tok.size() > 1 && tok[0] == '-' ) {
        throw std::runtime_error( "Unknown option " + std::string(tok) );
      }
      else {
        args.inputs.emplace_back( tok );
      }
    }
    if ( !args.help && args.inputs.empty() ) {
      throw std::runtime_error( "No input files given (see --help)" );
    }
    return args;
  }

  stratus::ordered_node load_inputs( const std::vector< std::string >& paths ) {
    std::vector< stratus::ordered_node > docs;
    for ( const auto& path : paths ) {
      try {
        if ( path == "-" ) {
          docs.push_back( stratus::internal::read_document(std::cin) );
          continue;
        }
        std::ifstream in( path );
        if ( !in ) throw std::runtime_error( "Unable to open input file" );
        docs.push_back( stratus::internal::read_document(in) );
      }
      catch ( const std::exception& ex ) {
        throw std::runtime_error( path + ": " + ex.what() );
      }
    }
    return stratus::internal::layer_documents( docs );
  }

  void print_tree( const std::string& title, const stratus::ordered_node& tree )
  {
    std::cout << "# " << title << '\n' << stratus::Applier::render( tree );
  }

} // namespace

int main( int argc, char** argv ) {
  try {
    const Args args = parse_args( argc, argv );
    if ( args.help ) {
      print_usage( argv[0] );
      return 0;
    }

    const stratus::ordered_node document = load_inputs( args.inputs );
    stratus::Expander expander( args.expander );
    const stratus::Expansion expansion = expander.expand( document );
    stratus::write_diagnostics( std::cerr, expansion, args.verbose );

    if ( args.print ) {
      print_tree( stratus::Applier::PROVIDER_DIR, expansion.providers );
      print_tree( stratus::Applier::PROFILE_DIR, expansion.profiles );
      print_tree( stratus::Applier::MAP_DIR, expansion.maps );
      return expansion.has_errors() ? 2 : 0;
    }

    if ( expansion.has_errors() && !args.allow_partial ) {
      std::cerr << "[stratus] error: nothing written because of the errors"
        " above (use --allow-partial to write anyway)\n";
      return 2;
    }

    stratus::Applier applier( args.apply );
    const stratus::ApplyReport report = applier.apply( expansion );
    for ( const auto& r : report.records ) {
      if ( r.change == stratus::FileChange::Unchanged && !args.verbose ) {
        continue;
      }
      std::cerr << "[stratus] " << stratus::change_name( r.change ) << ": "
        << r.path.string();
      if ( !r.comment.empty() ) std::cerr << " (" << r.comment << ')';
      std::cerr << '\n';
    }

    if ( !report.result ) return 1;
    return expansion.has_errors() ? 2 : 0;
  } catch ( const std::exception& ex ) {
    std::cerr << "[stratus] error: " << ex.what() << "\n";
    return 1;
  }
}

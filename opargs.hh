//  OPARGS - Operator and pipeline argument resolution
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cctype>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <locale>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace opargs {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the lexical order of the input, which
  // keeps the operator key first when a step is serialized back to text.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Flat argument storage: key -> string value
  using ArgMap = std::unordered_map< std::string, std::string >;

namespace internal {

  // Constants defining reserved keys and markers. This block provides a
  // single location for easy editing to allow for future changes.
  inline constexpr char BOOKKEEPING_PREFIX = '_';
  inline constexpr char INDIRECTION_MARKER = '^';

  inline const std::string DEFINITION = BOOKKEEPING_PREFIX
    + std::string( "definition" );
  inline const std::string NSTEPS = BOOKKEEPING_PREFIX
    + std::string( "nsteps" );
  inline const std::string STEP_PREFIX = BOOKKEEPING_PREFIX
    + std::string( "step_" );
  inline const std::string CAUSE = "cause";
  inline const std::string BADVALUE = "badvalue";
  inline const std::string GLOBALS = "globals";
  inline const std::string STEPS = "steps";
  inline const std::string INV = "inv";
  inline const std::string DOC_SEPARATOR = "---\n";

  // The single global default every operator starts out with
  inline const std::string DEFAULT_ELLPS_KEY = "ellps";
  inline const std::string DEFAULT_ELLPS = "GRS80";

  // Soft-failure causes recorded under CAUSE
  inline const std::string CANNOT_LOCATE = "Cannot locate definition";
  inline const std::string CANNOT_PARSE = "Cannot parse definition";
  inline const std::string TOO_MANY_ITEMS = "Too many items in definition root";
  inline const std::string CANNOT_READ_ARGS = "Cannot read args";

  // Key under which the serialized text of pipeline step idx is stored
  inline std::string step_key( std::size_t idx ) {
    return STEP_PREFIX + std::to_string( idx );
  }

  // Keys that are local to a single load and never inherited by a step
  inline bool is_load_local( const std::string& key ) {
    return ( !key.empty() && key[0] == BOOKKEEPING_PREFIX ) || key == INV;
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

  // Strict numeric parse: the whole text must be a floating point number,
  // read in the classic locale. Leading whitespace and hexadecimal forms are
  // rejected; the inf and nan spellings are accepted.
  inline bool parse_number( const std::string& text, double& out ) {
    if ( text.empty() ) return false;
    const unsigned char first = static_cast< unsigned char >( text[0] );
    if ( std::isspace(first) ) return false;
    if ( text.find_first_of("xX") != std::string::npos ) return false;

    std::string lower;
    for ( char c : text ) {
      lower += static_cast< char >(
        std::tolower( static_cast< unsigned char >(c) ) );
    }
    const std::size_t sign = ( lower[0] == '+' || lower[0] == '-' ) ? 1 : 0;
    const std::string bare = lower.substr( sign );
    if ( bare == "inf" || bare == "infinity" ) {
      out = ( lower[0] == '-' ) ? -std::numeric_limits< double >::infinity()
        : std::numeric_limits< double >::infinity();
      return true;
    }
    if ( bare == "nan" ) {
      out = std::numeric_limits< double >::quiet_NaN();
      return true;
    }

    std::istringstream iss( text );
    iss.imbue( std::locale::classic() );
    double v = 0.;
    iss >> v;
    if ( iss.fail() ) return false;
    if ( iss.peek() != std::char_traits< char >::eof() ) return false;
    out = v;
    return true;
  }

  // Shortest decimal text that reads back as the same double. The result
  // always carries a '.' or an exponent so it stays recognizably real.
  inline std::string real_to_text( double v ) {
    if ( std::isnan(v) ) return "nan";
    if ( std::isinf(v) ) return v < 0 ? "-inf" : "inf";

    std::string s;
    for ( int prec = std::numeric_limits< double >::digits10;
      prec <= std::numeric_limits< double >::max_digits10; ++prec )
    {
      std::ostringstream oss;
      oss.imbue( std::locale::classic() );
      oss << std::setprecision( prec ) << v;
      s = oss.str();
      double back = 0.;
      if ( parse_number(s, back) && back == v ) break;
    }
    if ( s.find_first_of(".eE") == std::string::npos ) s += ".0";
    return s;
  }

  // Scalar coercion shared by globals and plain operator args. Sequences,
  // mappings and nulls coerce to the empty string, which callers drop.
  inline std::string scalar_to_text( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return real_to_text(
      to_native_checked< double >( n )
    );
    return std::string();
  }

  // Mapping keys are text for our purposes. An empty result marks a key
  // that is not a usable scalar (null, sequence or mapping keys).
  inline std::string key_text( const ordered_node& k ) {
    if ( k.is_null() ) return std::string();
    return scalar_to_text( k );
  }

  // Drop the document separator the emitter may put in front of a node
  inline std::string strip_doc_separator( const std::string& text ) {
    std::string out = text;
    while ( out.compare(0, DOC_SEPARATOR.size(), DOC_SEPARATOR) == 0 ) {
      out.erase( 0, DOC_SEPARATOR.size() );
    }
    return out;
  }

  // Look up a mapping entry by the text form of its key, so that integer
  // and boolean keys are found under "1" or "true"
  inline const ordered_node* find_entry( const ordered_node& mapping,
    const std::string& key )
  {
    if ( !mapping.is_mapping() ) return nullptr;
    const auto& entries = mapping.get_value_ref<
      const ordered_node::mapping_type& >();
    for ( const auto& entry : entries ) {
      if ( !entry.first.is_null() && scalar_to_text(entry.first) == key ) {
        return &entry.second;
      }
    }
    return nullptr;
  }

} // namespace opargs::internal

  class OperatorArgs {
  public:

    // Empty store with an empty name
    OperatorArgs() = default;

    // Store populated by the global defaults (ellps: GRS80)
    static OperatorArgs global_defaults();

    // Store populated by the defaults from an existing store, combined with
    // a new definition. This is the mechanism for inheritance of global
    // args in pipelines: bookkeeping keys ('_' prefix) and "inv" are not
    // inherited, everything else is unless the definition overrides it.
    static OperatorArgs with_globals_from( const OperatorArgs& existing,
      const std::string& definition, const std::string& which );

    // Insert operator definition arguments, converted from a YAML setup
    // string.
    //
    // If which is empty, the first document is used, and its root must
    // hold exactly one entry not starting with '_'. That entry is the
    // definition to handle.
    //
    // If which is not empty, the first document with a root entry of that
    // name is used.
    //
    // The entry is handled as a pipeline if it holds a "steps" sequence,
    // and as a plain operator otherwise.
    //
    // Returns false and sets the name to "badvalue" (with the reason stored
    // under "cause") if the definition cannot be interpreted. Malformed
    // YAML is reported by the fkYAML exceptions, which are not caught here.
    bool populate( const std::string& definition, const std::string& which );

    const std::string& name() const { return name_; }
    void name( const std::string& name ) { name_ = name; }
    bool is_badvalue() const { return name_ == internal::BADVALUE; }

    void insert( const std::string& key, const std::string& value );

    // Copy every arg from additional, overwriting on conflict
    void append( const OperatorArgs& additional );

    bool contains( const std::string& key ) const {
      return args_.count( key ) > 0;
    }

    // Return the arg for a given key, following '^' indirections, and
    // maintain usage info. Throws on an indirection cycle.
    std::string value( const std::string& key,
      const std::string& default_value );

    // Key not given: default. Key given and numeric: its value. Key given
    // but not numeric: std::runtime_error naming the operator and the key.
    double numeric_value( const std::string& operator_name,
      const std::string& key, double default_value );

    // If key is given, and value != "false": true; else: false
    bool flag( const std::string& key );

    const ArgMap& args() const { return args_; }
    const ArgMap& used() const { return used_; }
    const ArgMap& all_used() const { return all_used_; }

    // The flat store as a YAML mapping with sorted keys
    ordered_node to_node() const;

  private:

    // Workhorse for value(). Kept separate so the original key is still
    // available once the indirection chain has been traversed.
    std::string value_recursive_search( const std::string& key,
      const std::string& default_value,
      std::unordered_set< std::string >& visited );

    // Flatten the scalar entries of a mapping into the store
    void insert_scalars( const ordered_node& mapping, bool skip_inv );

    bool badvalue( const std::string& cause );

    std::string name_;
    ArgMap args_;
    ArgMap used_;
    ArgMap all_used_; // includes intermediate steps of indirect definitions

  }; // class OperatorArgs

} // namespace opargs

inline opargs::OperatorArgs opargs::OperatorArgs::global_defaults() {
  OperatorArgs oa;
  oa.insert( internal::DEFAULT_ELLPS_KEY, internal::DEFAULT_ELLPS );
  return oa;
}

inline opargs::OperatorArgs opargs::OperatorArgs::with_globals_from(
  const OperatorArgs& existing, const std::string& definition,
  const std::string& which )
{
  OperatorArgs oa;
  for ( const auto& [arg, val] : existing.args_ ) {
    if ( internal::is_load_local(arg) ) continue;
    oa.insert( arg, val );
  }
  oa.populate( definition, which );
  return oa;
}

inline bool opargs::OperatorArgs::populate( const std::string& definition,
  const std::string& which )
{
  using internal::CANNOT_LOCATE;
  using internal::CANNOT_PARSE;

  // First, copy the full text in the args, to enable recursive definitions
  this->insert( internal::DEFINITION, definition );

  // Read the entire YAML stream and try to locate the 'which' document
  std::vector< ordered_node > docs
    = ordered_node::deserialize_docs( definition );

  std::size_t index = 0;
  if ( !which.empty() ) {
    index = docs.size();
    for ( std::size_t i = 0; i < docs.size(); ++i ) {
      if ( internal::find_entry(docs[ i ], which) ) {
        index = i;
        break;
      }
    }
    if ( index == docs.size() ) return this->badvalue( CANNOT_LOCATE );
  }
  if ( docs.empty() ) return this->badvalue( CANNOT_PARSE );

  const ordered_node& root = docs[ index ];
  if ( !root.is_mapping() ) return this->badvalue( CANNOT_PARSE );

  // Is it conforming?
  std::string main_entry_name = which;
  if ( main_entry_name.empty() ) {
    for ( const auto& [mk, mv] : root.map_items() ) {
      const std::string arg = internal::key_text( mk );
      if ( arg.empty() ) return this->badvalue( CANNOT_PARSE );
      if ( arg[0] == internal::BOOKKEEPING_PREFIX ) continue;
      if ( !main_entry_name.empty() ) {
        return this->badvalue( internal::TOO_MANY_ITEMS );
      }
      main_entry_name = arg;
    }
  }
  name_ = main_entry_name;

  // Grab the sub-tree defining the main entry. With no usable root entry
  // the name stays empty and the lookup fails here.
  const ordered_node* found = main_entry_name.empty()
    ? nullptr : internal::find_entry( root, main_entry_name );
  if ( !found ) return this->badvalue( CANNOT_LOCATE );
  const ordered_node& main_entry = *found;

  // Loop over all globals and create the corresponding entries
  if ( main_entry.is_mapping() && main_entry.contains(internal::GLOBALS) ) {
    const ordered_node& globals = main_entry.at( internal::GLOBALS );
    if ( globals.is_mapping() ) this->insert_scalars( globals, true );
  }

  // Try to locate the step definitions, to determine whether we are
  // handling a pipeline or a plain operator definition
  const bool is_pipeline = main_entry.is_mapping()
    && main_entry.contains( internal::STEPS )
    && main_entry.at( internal::STEPS ).is_sequence();

  // Not a pipeline? Just insert the operator args and return
  if ( !is_pipeline ) {
    if ( !main_entry.is_mapping() ) {
      return this->badvalue( internal::CANNOT_READ_ARGS );
    }
    this->insert_scalars( main_entry, false );
    return true;
  }

  // It's a pipeline: record the number of steps, then each step, written
  // back to YAML text for the pipeline builder to parse on its own
  const ordered_node& steps = main_entry.at( internal::STEPS );
  this->insert( internal::NSTEPS, std::to_string(steps.size()) );
  for ( std::size_t i = 0; i < steps.size(); ++i ) {
    const std::string step_definition = ordered_node::serialize( steps.at(i) );
    this->insert( internal::step_key(i),
      internal::strip_doc_separator(step_definition) );
  }

  return true;
}

inline void opargs::OperatorArgs::insert_scalars( const ordered_node& mapping,
  bool skip_inv )
{
  for ( const auto& [mk, mv] : mapping.map_items() ) {
    const std::string arg = internal::key_text( mk );
    if ( arg.empty() ) continue;
    if ( skip_inv && arg == internal::INV ) continue;
    const std::string val = internal::scalar_to_text( mv );
    if ( !val.empty() ) this->insert( arg, val );
  }
}

inline bool opargs::OperatorArgs::badvalue( const std::string& cause ) {
  name_ = internal::BADVALUE;
  this->insert( internal::CAUSE, cause );
  return false;
}

inline void opargs::OperatorArgs::insert( const std::string& key,
  const std::string& value )
{
  args_[ key ] = value;
}

inline void opargs::OperatorArgs::append( const OperatorArgs& additional ) {
  for ( const auto& [key, val] : additional.args_ ) {
    this->insert( key, val );
  }
}

inline std::string opargs::OperatorArgs::value_recursive_search(
  const std::string& key, const std::string& default_value,
  std::unordered_set< std::string >& visited )
{
  auto it = args_.find( key );
  if ( it == args_.end() ) return default_value;
  const std::string arg = it->second;

  if ( !visited.insert(key).second ) {
    std::ostringstream oss;
    oss << "Indirection cycle detected while resolving '" << key
      << "' (chain revisits it via '" << arg << "').";
    throw std::runtime_error( oss.str() );
  }

  all_used_[ key ] = arg;

  if ( !arg.empty() && arg[0] == internal::INDIRECTION_MARKER ) {
    return this->value_recursive_search( arg.substr(1), default_value,
      visited );
  }
  return arg;
}

inline std::string opargs::OperatorArgs::value( const std::string& key,
  const std::string& default_value )
{
  std::unordered_set< std::string > visited;
  const std::string arg = this->value_recursive_search( key, default_value,
    visited );
  if ( arg != default_value ) used_[ key ] = arg;
  return arg;
}

inline double opargs::OperatorArgs::numeric_value(
  const std::string& operator_name, const std::string& key,
  double default_value )
{
  const std::string arg = this->value( key, "" );

  // Key not given: return default
  if ( arg.empty() ) return default_value;

  // Key given, value numeric: return value
  double v = 0.;
  if ( internal::parse_number(arg, v) ) return v;

  // Key given, but not numeric
  std::ostringstream oss;
  oss << "Numeric value expected for '" << operator_name << '.' << key
    << "' - got [" << key << ": " << arg << "].";
  throw std::runtime_error( oss.str() );
}

inline bool opargs::OperatorArgs::flag( const std::string& key ) {
  return this->value( key, "false" ) != "false";
}

inline opargs::ordered_node opargs::OperatorArgs::to_node() const {
  std::map< std::string, std::string > sorted( args_.begin(), args_.end() );
  ordered_node out = ordered_node::mapping();
  for ( const auto& [key, val] : sorted ) {
    out[ key ] = internal::make_node_from( val );
  }
  return out;
}

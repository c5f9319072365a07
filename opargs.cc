#include <iostream>
#include <iterator>

#include "opargs.hh"

// Usage: opargs [which] < definition.yml
int main( int argc, char* argv[] ) {
  try {
    if ( argc > 2 ) {
      throw std::runtime_error( "usage: opargs [which] < definition.yml" );
    }
    const std::string which = ( argc == 2 ) ? argv[ 1 ] : "";
    const std::string definition{ std::istreambuf_iterator< char >( std::cin ),
      std::istreambuf_iterator< char >() };

    opargs::OperatorArgs args = opargs::OperatorArgs::global_defaults();
    if ( !args.populate(definition, which) ) {
      throw std::runtime_error( args.value(opargs::internal::CAUSE, "") );
    }

    // The full text is already on stdin, so _definition is left out
    const opargs::ordered_node all = args.to_node();
    opargs::ordered_node flat = opargs::ordered_node::mapping();
    for ( const auto& [mk, mv] : all.map_items() ) {
      const std::string key = mk.get_value< std::string >();
      if ( key == opargs::internal::DEFINITION ) continue;
      flat[ key ] = mv;
    }

    opargs::ordered_node out = opargs::ordered_node::mapping();
    out[ "name" ] = opargs::internal::make_node_from( args.name() );
    out[ "args" ] = flat;
    std::cout << opargs::ordered_node::serialize( out );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[opargs] error: " << ex.what() << "\n";
    return 1;
  }
}

#include "CpCommand.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

int main( int argc, const char * argv[] )
{
    auto options = cp::optionNames();
    auto valid = argot::validateOptionNames( options );
    if( !valid ) {
        std::cerr << "Error in command definition: " << valid.errorMessage() << std::endl;
        return 1;
    }

    std::vector<std::string> args( argv + 1, argv + argc );
    auto state = cp::run( cp::makeEdges( options ), args );

    if( state.hasError() ) {
        std::cerr << "Usage Error: " << *state.errorMessage << std::endl;
        for( std::size_t i = 0; i < args.size(); ++i ) {
            for( auto const &token : argot::tokensForSegment( state, i ) )
                std::cerr << "  " << args[i] << ": " << token << std::endl;
        }
        return 1;
    }

    if( state.selectedIndex && state.selectedIndex->isHelpRequest() ) {
        std::cout << "Usage: cp [-r,--recursive] <sources...> <destination>" << std::endl;
        return 0;
    }

    bool recursive = false;
    for( auto const &option : state.options )
        if( option.first == "-r" )
            recursive = option.second.boolValue();

    std::cout << "recursive: " << ( recursive ? "true" : "false" ) << std::endl;
    for( std::size_t i = 0; i + 1 < state.positionals.size(); ++i )
        std::cout << "source: " << state.positionals[i].value << std::endl;
    std::cout << "destination: " << state.positionals.back().value << std::endl;
    return 0;
}

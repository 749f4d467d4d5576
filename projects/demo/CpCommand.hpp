#ifndef ARGOT_DEMO_CP_COMMAND_HPP_INCLUDED
#define ARGOT_DEMO_CP_COMMAND_HPP_INCLUDED

#include "argot.hpp"

#include <cstddef>
#include <string>
#include <vector>

// A small, hard-wired walk over "cp [-r,--recursive] <sources...> <destination>".
// A real transition engine compiles this edge list from the command definitions;
// here it is just enough to show the checks and reducers doing their job.

namespace cp {

    struct Edge {
        argot::Check check;
        argot::Reducer reducer;
    };

    inline auto optionNames() -> argot::OptionNames {
        return { "-r", "--recursive" };
    }

    inline auto makeEdges( argot::OptionNames const &options ) -> std::vector<Edge> {
        using argot::Check;
        using argot::Reducer;
        return {
            { Check::isExact( "--" ), Reducer::inhibateOptions() },
            { Check::isHelp(), Reducer::useHelp( 0 ) },
            { Check::isExactString( "-r" ), Reducer::pushTrue( "-r" ) },
            { Check::isExactString( "--recursive" ), Reducer::pushTrue( "-r" ) },
            { Check::isBatchOption( options ), Reducer::pushBatch() },
            { Check::isInvalidOption(), Reducer::setError( "Invalid option name" ) },
            { Check::isUnsupportedOption( options ), Reducer::setError( "Unsupported option name" ) },
            { Check::isNotOptionLike(), Reducer::pushPositional() }
        };
    }

    inline auto run( std::vector<Edge> const &edges, std::vector<std::string> const &args ) -> argot::RunState {
        argot::RunState state;
        auto end = argot::Arg::endOfInput();

        for( std::size_t i = 0; i < args.size(); ++i ) {
            auto arg = argot::Arg::user( args[i] );
            bool helpRequested = false;
            for( auto const &edge : edges ) {
                if( argot::applyCheck( edge.check, state, arg, i ) ) {
                    state = argot::applyReducer( edge.reducer, state, arg, i );
                    helpRequested = edge.reducer.type == argot::ReducerType::UseHelp;
                    break;
                }
            }
            if( state.hasError() )
                return state;
            // Help wins over whatever follows it
            if( helpRequested )
                return argot::applyReducer( argot::Reducer::setSelectedIndex( argot::Selection::helpRequest() ), state, end, args.size() );
        }

        if( state.positionals.size() < 2 )
            return argot::applyReducer( argot::Reducer::setError( "Not enough positional arguments" ), state, end, args.size() );
        return argot::applyReducer( argot::Reducer::setSelectedIndex( argot::Selection::command( 0 ) ), state, end, args.size() );
    }

} // namespace cp

#endif // ARGOT_DEMO_CP_COMMAND_HPP_INCLUDED

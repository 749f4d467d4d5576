#include "argot.hpp"

#include "TestHelpers.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using namespace argot;

namespace {

    enum class Node {
        Start, TargetValue, Help
    };

    struct Edge {
        Node from;
        Check check;
        Reducer reducer;
        Node to;
    };

    struct Machine {
        std::vector<Edge> edges;
        std::map<Node, Reducer> onEnd;
    };

    // cp [-r,--recursive] [--target <dir>] <paths...>
    auto makeCp() -> Machine {
        OptionNames known = { "-r", "--recursive", "--target" };

        Machine m;
        m.edges = {
            { Node::Start, Check::isExact( "--" ), Reducer::inhibateOptions(), Node::Start },
            { Node::Start, Check::isHelp(), Reducer::useHelp( 0 ), Node::Help },
            { Node::Start, Check::isExactString( "-r" ), Reducer::pushTrue( "-r" ), Node::Start },
            { Node::Start, Check::isExactString( "--recursive" ), Reducer::pushTrue( "--recursive" ), Node::Start },
            { Node::Start, Check::isExactString( "--target" ), Reducer::pushNone( "--target" ), Node::TargetValue },
            { Node::Start, Check::isBoundOption( { "--target" } ), Reducer::pushBound(), Node::Start },
            { Node::Start, Check::isBatchOption( { "-r" } ), Reducer::pushBatch(), Node::Start },
            { Node::Start, Check::isInvalidOption(), Reducer::setError( "Invalid option name" ), Node::Start },
            { Node::Start, Check::isUnsupportedOption( known ), Reducer::setError( "Unsupported option name" ), Node::Start },
            { Node::Start, Check::isNotOptionLike(), Reducer::pushPositional(), Node::Start },

            { Node::TargetValue, Check::isNotOptionLike(), Reducer::setStringValue(), Node::Start },
            { Node::TargetValue, Check::isOptionLike(), Reducer::setOptionArityError(), Node::Start },

            { Node::Help, Check::always(), Reducer::none(), Node::Help }
        };
        m.onEnd.emplace( Node::Start, Reducer::setSelectedIndex( Selection::command( 0 ) ) );
        m.onEnd.emplace( Node::TargetValue, Reducer::setOptionArityError() );
        m.onEnd.emplace( Node::Help, Reducer::setSelectedIndex( Selection::helpRequest() ) );
        return m;
    }

    auto walk( Machine const &m, std::vector<std::string> const &argv ) -> RunState {
        RunState state;
        Node node = Node::Start;

        for( std::size_t i = 0; i < argv.size(); ++i ) {
            auto arg = Arg::user( argv[i] );
            auto it = std::find_if( m.edges.begin(), m.edges.end(), [&]( Edge const &edge ) {
                return edge.from == node && applyCheck( edge.check, state, arg, i );
            } );
            if( it == m.edges.end() )
                return applyReducer( Reducer::setError( "Extraneous positional argument" ), state, arg, i );

            state = applyReducer( it->reducer, state, arg, i );
            if( state.hasError() )
                return state;
            node = it->to;
        }
        return applyReducer( m.onEnd.at( node ), state, Arg::endOfInput(), argv.size() );
    }

}

TEST_CASE( "walk" ) {
    auto cp = makeCp();

    SECTION( "flags and positionals" ) {
        auto state = walk( cp, { "-r", "src1", "src2", "dest" } );

        CHECK_FALSE( state.hasError() );
        REQUIRE( state.selectedIndex );
        CHECK( *state.selectedIndex == Selection::command( 0 ) );

        REQUIRE( state.options.size() == 1 );
        CHECK( state.options[0] == OptionBinding( "-r", OptionValue::boolean( true ) ) );

        REQUIRE( state.positionals.size() == 3 );
        CHECK( state.positionals[0] == Positional::required( "src1" ) );
        CHECK( state.positionals[2] == Positional::required( "dest" ) );

        REQUIRE( state.tokens.size() == 1 );
        CHECK( state.tokens[0] == Token::option( 0, std::nullopt, "-r" ) );
    }
    SECTION( "bundled flags" ) {
        auto state = walk( cp, { "-rr", "a", "b" } );

        REQUIRE( state.options.size() == 2 );
        CHECK( state.tokens[0] == Token::option( 0, Slice( 0, 2 ), "-r" ) );
        CHECK( state.tokens[1] == Token::option( 0, Slice( 2, 3 ), "-r" ) );
    }
    SECTION( "option value in the next argument" ) {
        auto state = walk( cp, { "--target", "out", "a" } );

        CHECK_FALSE( state.hasError() );
        REQUIRE( state.options.size() == 1 );
        CHECK( state.options[0] == OptionBinding( "--target", OptionValue::string( "out" ) ) );
        REQUIRE( state.tokens.size() == 2 );
        CHECK( state.tokens[0] == Token::option( 0, std::nullopt, "--target" ) );
        CHECK( state.tokens[1] == Token::value( 1, std::nullopt ) );
        CHECK( state.positionals == std::vector<Positional>{ Positional::required( "a" ) } );
    }
    SECTION( "bound option value" ) {
        auto state = walk( cp, { "a", "--target=out" } );

        CHECK_FALSE( state.hasError() );
        CHECK( state.options[0] == OptionBinding( "--target", OptionValue::string( "out" ) ) );

        auto tokens = tokensForSegment( state, 1 );
        REQUIRE( tokens.size() == 3 );
        CHECK( tokens[2] == Token::value( 1, Slice( 9, 12 ) ) );
    }
    SECTION( "missing option value at the end" ) {
        auto state = walk( cp, { "a", "--target" } );
        CHECK( *state.errorMessage == "Not enough arguments to option --target." );
        CHECK_FALSE( state.selectedIndex );
    }
    SECTION( "option where a value was expected" ) {
        auto state = walk( cp, { "--target", "-r" } );
        CHECK( *state.errorMessage == "Not enough arguments to option --target." );
    }
    SECTION( "option terminator" ) {
        auto state = walk( cp, { "--", "-r", "--", "a" } );

        CHECK_FALSE( state.hasError() );
        CHECK( state.ignoreOptions );
        CHECK( state.options.empty() );
        REQUIRE( state.positionals.size() == 3 );
        CHECK( state.positionals[0] == Positional::required( "-r" ) );
        CHECK( state.positionals[1] == Positional::required( "--" ) );
    }
    SECTION( "unsupported option" ) {
        auto state = walk( cp, { "--bogus", "a" } );
        CHECK( *state.errorMessage == "Unsupported option name (\"--bogus\")." );
        CHECK( state.positionals.empty() );
    }
    SECTION( "unknown letter in a bundle" ) {
        auto state = walk( cp, { "-rx" } );
        CHECK( *state.errorMessage == "Unsupported option name (\"-rx\")." );
    }
    SECTION( "malformed option" ) {
        auto state = walk( cp, { "--bad!" } );
        CHECK( *state.errorMessage == "Invalid option name (\"--bad!\")." );
    }
    SECTION( "help" ) {
        auto state = walk( cp, { "a", "--help", "--bogus" } );

        CHECK_FALSE( state.hasError() );
        REQUIRE( state.selectedIndex );
        CHECK( state.selectedIndex->isHelpRequest() );
        REQUIRE( state.options.size() == 1 );
        CHECK( state.options[0] == OptionBinding( "-c", OptionValue::string( "0" ) ) );
    }
}

TEST_CASE( "forked exploration" ) {
    auto shared = applyReducer( Reducer::pushTrue( "-r" ), RunState(), Arg::user( "-r" ), 0 );
    RunState const snapshot = shared;

    auto arg = Arg::user( "x" );
    auto asPositional = applyReducer( Reducer::pushPositional(), shared, arg, 1 );
    auto asPath = applyReducer( Reducer::pushPath(), shared, arg, 1 );
    auto asError = applyReducer( Reducer::setError( "Extraneous positional argument" ), shared, arg, 1 );

    CHECK( shared == snapshot );

    CHECK( asPositional.positionals.size() == 1 );
    CHECK( asPositional.path.empty() );
    CHECK_FALSE( asPositional.hasError() );

    CHECK( asPath.path == std::vector<std::string>{ "x" } );
    CHECK( asPath.positionals.empty() );

    CHECK( *asError.errorMessage == "Extraneous positional argument (\"x\")." );
    CHECK( asError.positionals.empty() );

    SECTION( "promoting a candidate" ) {
        auto promoted = applyReducer( Reducer::setCandidateState( PartialRunState::from( asPositional ) ),
                                      asError, Arg::endOfInput(), 2 );
        // errorMessage is absent in the candidate, so the overlay leaves it alone
        CHECK( promoted.positionals == asPositional.positionals );
        CHECK( promoted.hasError() );
        CHECK( asPositional.positionals.size() == 1 );
    }
}

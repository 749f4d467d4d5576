// Copyright 2026 The Argot Authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

// Argot v1.0.0

#ifndef ARGOT_HPP_INCLUDED
#define ARGOT_HPP_INCLUDED

#ifndef ARGOT_CONFIG_HELP_OPTION_NAME
#define ARGOT_CONFIG_HELP_OPTION_NAME "-c"
#endif

#ifndef ARGOT_CONFIG_HELP_LONG
#define ARGOT_CONFIG_HELP_LONG "--help"
#endif

#ifndef ARGOT_CONFIG_HELP_SHORT
#define ARGOT_CONFIG_HELP_SHORT "-h"
#endif

#include <algorithm>
#include <cassert>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace argot {
namespace detail {

    // Internal contract check. A failure means the grammar scheduled an edge in a state
    // that cannot take it, so there is nothing sensible to report to the user.
    inline void enforce( bool condition, char const *what ) {
        (void)what;
        assert( condition && what );
        if( !condition )
            std::abort();
    }

    inline auto startsWith( std::string const &str, std::string const &prefix ) -> bool {
        return str.size() >= prefix.size() && str.compare( 0, prefix.size(), prefix ) == 0;
    }

    // Result of validating a definition-time setting (never fatal)
    class Result {
    public:
        enum Type {
            Ok, LogicError
        };

        static auto ok() -> Result { return { Ok, std::string() }; }
        static auto logicError( std::string const &message ) -> Result { return { LogicError, message }; }

        explicit operator bool() const { return m_type == Ok; }
        auto type() const -> Type { return m_type; }
        auto errorMessage() const -> std::string const& { return m_errorMessage; }

    private:
        Result( Type type, std::string const &message )
        :   m_type( type ),
            m_errorMessage( message )
        {}

        Type m_type;
        std::string m_errorMessage; // Only populated if type is an error
    };

    // One unit of input: a literal argv element, or one of the two boundary sentinels
    class Arg {
    public:
        enum class Type {
            User, EndOfInput, EndOfPartialInput
        };

        static auto user( std::string text ) -> Arg { return Arg( Type::User, std::move( text ) ); }
        static auto endOfInput() -> Arg { return Arg( Type::EndOfInput, std::string() ); }
        static auto endOfPartialInput() -> Arg { return Arg( Type::EndOfPartialInput, std::string() ); }

        auto type() const -> Type { return m_type; }
        auto isUser() const -> bool { return m_type == Type::User; }
        auto isSentinel() const -> bool { return m_type != Type::User; }

        // Only callable on edges already guarded against the sentinels
        auto unwrapUser() const -> std::string const& {
            enforce( isUser(), "unwrapUser() called on a boundary sentinel" );
            return m_text;
        }

    private:
        Arg( Type type, std::string text )
        :   m_type( type ),
            m_text( std::move( text ) )
        {}

        Type m_type;
        std::string m_text;
    };

    // None is a placeholder: the option was recognised but its value is still pending
    class OptionValue {
    public:
        enum class Type {
            None, Bool, String, Array
        };

        OptionValue() = default;

        static auto none() -> OptionValue { return OptionValue(); }
        static auto boolean( bool value ) -> OptionValue {
            OptionValue v;
            v.m_type = Type::Bool;
            v.m_bool = value;
            return v;
        }
        static auto string( std::string value ) -> OptionValue {
            OptionValue v;
            v.m_type = Type::String;
            v.m_string = std::move( value );
            return v;
        }
        static auto array( std::vector<std::string> values ) -> OptionValue {
            OptionValue v;
            v.m_type = Type::Array;
            v.m_array = std::move( values );
            return v;
        }

        auto type() const -> Type { return m_type; }
        auto isNone() const -> bool { return m_type == Type::None; }

        auto boolValue() const -> bool {
            enforce( m_type == Type::Bool, "option value is not a Bool" );
            return m_bool;
        }
        auto stringValue() const -> std::string const& {
            enforce( m_type == Type::String, "option value is not a String" );
            return m_string;
        }
        auto arrayValue() const -> std::vector<std::string> const& {
            enforce( m_type == Type::Array, "option value is not an Array" );
            return m_array;
        }

        // Promotes a pending None to a one-element Array, or appends to an existing Array
        void pushString( std::string value ) {
            enforce( isNone() || m_type == Type::Array,
                     "can only append a value to a None or Array option value" );
            m_type = Type::Array;
            m_array.push_back( std::move( value ) );
        }

        friend auto operator==( OptionValue const &lhs, OptionValue const &rhs ) -> bool {
            if( lhs.m_type != rhs.m_type )
                return false;
            switch( lhs.m_type ) {
                case Type::None:
                    return true;
                case Type::Bool:
                    return lhs.m_bool == rhs.m_bool;
                case Type::String:
                    return lhs.m_string == rhs.m_string;
                case Type::Array:
                    return lhs.m_array == rhs.m_array;
            }
            return false;
        }
        friend auto operator!=( OptionValue const &lhs, OptionValue const &rhs ) -> bool {
            return !( lhs == rhs );
        }

    private:
        Type m_type = Type::None;
        bool m_bool = false;
        std::string m_string;
        std::vector<std::string> m_array;
    };

    // How a bare argument was classified when it was consumed
    struct Positional {
        enum class Type {
            Required, Optional, Rest
        };

        Type type;
        std::string value;

        static auto required( std::string value ) -> Positional { return { Type::Required, std::move( value ) }; }
        static auto optional( std::string value ) -> Positional { return { Type::Optional, std::move( value ) }; }
        static auto rest( std::string value ) -> Positional { return { Type::Rest, std::move( value ) }; }

        friend auto operator==( Positional const &lhs, Positional const &rhs ) -> bool {
            return lhs.type == rhs.type && lhs.value == rhs.value;
        }
        friend auto operator!=( Positional const &lhs, Positional const &rhs ) -> bool {
            return !( lhs == rhs );
        }
    };

    // Half-open [start, end) character range within one argv element
    using Slice = std::pair<std::size_t, std::size_t>;

    // Records which characters of which argv element were consumed, and as what.
    // A token with no slice covers its segment conceptually rather than a scanned sub-range.
    enum class TokenType {
        Option, Assign, Value
    };
    struct Token {
        TokenType type;
        std::size_t segmentIndex;
        std::optional<Slice> slice;
        std::string optionName; // Only populated for Option tokens

        static auto option( std::size_t segmentIndex, std::optional<Slice> slice, std::string name ) -> Token {
            return { TokenType::Option, segmentIndex, slice, std::move( name ) };
        }
        static auto assign( std::size_t segmentIndex, Slice slice ) -> Token {
            return { TokenType::Assign, segmentIndex, slice, std::string() };
        }
        static auto value( std::size_t segmentIndex, std::optional<Slice> slice ) -> Token {
            return { TokenType::Value, segmentIndex, slice, std::string() };
        }

        friend auto operator==( Token const &lhs, Token const &rhs ) -> bool {
            return lhs.type == rhs.type
                && lhs.segmentIndex == rhs.segmentIndex
                && lhs.slice == rhs.slice
                && lhs.optionName == rhs.optionName;
        }
        friend auto operator!=( Token const &lhs, Token const &rhs ) -> bool {
            return !( lhs == rhs );
        }
    };

    // Which declared command a state is a candidate for, or a redirection to help
    class Selection {
    public:
        enum class Type {
            Command, HelpRequest
        };

        static auto command( std::size_t index ) -> Selection { return Selection( Type::Command, index ); }
        static auto helpRequest() -> Selection { return Selection( Type::HelpRequest, 0 ); }

        auto type() const -> Type { return m_type; }
        auto isHelpRequest() const -> bool { return m_type == Type::HelpRequest; }

        auto commandIndex() const -> std::size_t {
            enforce( m_type == Type::Command, "help request selection has no command index" );
            return m_index;
        }

        friend auto operator==( Selection const &lhs, Selection const &rhs ) -> bool {
            return lhs.m_type == rhs.m_type && lhs.m_index == rhs.m_index;
        }
        friend auto operator!=( Selection const &lhs, Selection const &rhs ) -> bool {
            return !( lhs == rhs );
        }

    private:
        Selection( Type type, std::size_t index )
        :   m_type( type ),
            m_index( index )
        {}

        Type m_type;
        std::size_t m_index;
    };

    using OptionBinding = std::pair<std::string, OptionValue>;

    struct PartialRunState;

    // The parse state threaded through every step. Reducers never modify one in place;
    // they hand back a fresh copy, so earlier states stay valid for other continuations.
    struct RunState {
        bool ignoreOptions = false;
        std::vector<OptionBinding> options;
        std::vector<Positional> positionals;
        std::vector<Token> tokens;
        std::vector<std::string> path;
        std::optional<std::string> errorMessage;
        std::optional<Selection> selectedIndex;

        auto hasError() const -> bool { return errorMessage.has_value(); }

        auto lastOption() const -> OptionBinding const& {
            enforce( !options.empty(), "no option has been pushed yet" );
            return options.back();
        }
        auto lastOption() -> OptionBinding& {
            enforce( !options.empty(), "no option has been pushed yet" );
            return options.back();
        }

        void pushToken( Token token ) {
            assert( tokens.empty() || tokens.back().segmentIndex <= token.segmentIndex );
            tokens.push_back( std::move( token ) );
        }

        void applySome( PartialRunState const &partial );

        friend auto operator==( RunState const &lhs, RunState const &rhs ) -> bool {
            return lhs.ignoreOptions == rhs.ignoreOptions
                && lhs.options == rhs.options
                && lhs.positionals == rhs.positionals
                && lhs.tokens == rhs.tokens
                && lhs.path == rhs.path
                && lhs.errorMessage == rhs.errorMessage
                && lhs.selectedIndex == rhs.selectedIndex;
        }
        friend auto operator!=( RunState const &lhs, RunState const &rhs ) -> bool {
            return !( lhs == rhs );
        }
    };

    // Sparse overlay of a RunState: only the fields that are present get adopted
    struct PartialRunState {
        std::optional<bool> ignoreOptions;
        std::optional<std::vector<OptionBinding>> options;
        std::optional<std::vector<Positional>> positionals;
        std::optional<std::vector<Token>> tokens;
        std::optional<std::vector<std::string>> path;
        std::optional<std::string> errorMessage;
        std::optional<Selection> selectedIndex;

        // Captures every field of a state, for adopting an explored candidate wholesale
        static auto from( RunState const &state ) -> PartialRunState {
            PartialRunState partial;
            partial.ignoreOptions = state.ignoreOptions;
            partial.options = state.options;
            partial.positionals = state.positionals;
            partial.tokens = state.tokens;
            partial.path = state.path;
            partial.errorMessage = state.errorMessage;
            partial.selectedIndex = state.selectedIndex;
            return partial;
        }
    };

    inline void RunState::applySome( PartialRunState const &partial ) {
        if( partial.ignoreOptions )
            ignoreOptions = *partial.ignoreOptions;
        if( partial.options )
            options = *partial.options;
        if( partial.positionals )
            positionals = *partial.positionals;
        if( partial.tokens )
            tokens = *partial.tokens;
        if( partial.path )
            path = *partial.path;
        if( partial.errorMessage )
            errorMessage = partial.errorMessage;
        if( partial.selectedIndex )
            selectedIndex = partial.selectedIndex;
    }

    using OptionNames = std::set<std::string>;

    enum class CheckType {
        Always,
        IsBatchOption,
        IsBoundOption,
        IsExact,
        IsExactString,
        IsHelp,
        IsNotOptionLike,
        IsOptionLike,
        IsUnsupportedOption,
        IsInvalidOption
    };

    // Guard on a transition. Only the payload relevant to the type is populated.
    struct Check {
        CheckType type;
        std::string needle;  // IsExact, IsExactString
        OptionNames options; // IsBatchOption, IsBoundOption, IsUnsupportedOption

        static auto always() -> Check { return { CheckType::Always, std::string(), OptionNames() }; }
        static auto isBatchOption( OptionNames options ) -> Check { return { CheckType::IsBatchOption, std::string(), std::move( options ) }; }
        static auto isBoundOption( OptionNames options ) -> Check { return { CheckType::IsBoundOption, std::string(), std::move( options ) }; }
        static auto isExact( std::string needle ) -> Check { return { CheckType::IsExact, std::move( needle ), OptionNames() }; }
        static auto isExactString( std::string needle ) -> Check { return { CheckType::IsExactString, std::move( needle ), OptionNames() }; }
        static auto isHelp() -> Check { return { CheckType::IsHelp, std::string(), OptionNames() }; }
        static auto isNotOptionLike() -> Check { return { CheckType::IsNotOptionLike, std::string(), OptionNames() }; }
        static auto isOptionLike() -> Check { return { CheckType::IsOptionLike, std::string(), OptionNames() }; }
        static auto isUnsupportedOption( OptionNames options ) -> Check { return { CheckType::IsUnsupportedOption, std::string(), std::move( options ) }; }
        static auto isInvalidOption() -> Check { return { CheckType::IsInvalidOption, std::string(), OptionNames() }; }
    };

    enum class ReducerType {
        None,
        InhibateOptions,
        PushBatch,
        PushBound,
        PushExtra,
        PushFalse,
        PushNone,
        PushPath,
        PushPositional,
        PushRest,
        PushStringValue,
        PushTrue,
        SetCandidateState,
        SetError,
        SetOptionArityError,
        SetSelectedIndex,
        SetStringValue,
        UseHelp
    };

    // Action taken when a transition fires
    struct Reducer {
        ReducerType type;
        std::string text;                                 // option name for Push{True,False,None}, message for SetError
        std::size_t helpIndex;                            // UseHelp
        std::optional<Selection> selection;               // SetSelectedIndex
        std::shared_ptr<PartialRunState const> candidate; // SetCandidateState

        static auto none() -> Reducer { return make( ReducerType::None ); }
        static auto inhibateOptions() -> Reducer { return make( ReducerType::InhibateOptions ); }
        static auto pushBatch() -> Reducer { return make( ReducerType::PushBatch ); }
        static auto pushBound() -> Reducer { return make( ReducerType::PushBound ); }
        static auto pushExtra() -> Reducer { return make( ReducerType::PushExtra ); }
        static auto pushFalse( std::string name ) -> Reducer { return make( ReducerType::PushFalse, std::move( name ) ); }
        static auto pushNone( std::string name ) -> Reducer { return make( ReducerType::PushNone, std::move( name ) ); }
        static auto pushPath() -> Reducer { return make( ReducerType::PushPath ); }
        static auto pushPositional() -> Reducer { return make( ReducerType::PushPositional ); }
        static auto pushRest() -> Reducer { return make( ReducerType::PushRest ); }
        static auto pushStringValue() -> Reducer { return make( ReducerType::PushStringValue ); }
        static auto pushTrue( std::string name ) -> Reducer { return make( ReducerType::PushTrue, std::move( name ) ); }
        static auto setError( std::string message ) -> Reducer { return make( ReducerType::SetError, std::move( message ) ); }
        static auto setOptionArityError() -> Reducer { return make( ReducerType::SetOptionArityError ); }
        static auto setStringValue() -> Reducer { return make( ReducerType::SetStringValue ); }

        static auto setCandidateState( PartialRunState partial ) -> Reducer {
            auto reducer = make( ReducerType::SetCandidateState );
            reducer.candidate = std::make_shared<PartialRunState const>( std::move( partial ) );
            return reducer;
        }
        static auto setSelectedIndex( Selection selection ) -> Reducer {
            auto reducer = make( ReducerType::SetSelectedIndex );
            reducer.selection = selection;
            return reducer;
        }
        static auto useHelp( std::size_t index ) -> Reducer {
            auto reducer = make( ReducerType::UseHelp );
            reducer.helpIndex = index;
            return reducer;
        }

    private:
        static auto make( ReducerType type, std::string text = std::string() ) -> Reducer {
            return { type, std::move( text ), 0, std::nullopt, nullptr };
        }
    };

    // --x is valid if everything after the dashes is alphanumeric or '-';
    // -x is valid if everything after the dash is alphabetic
    inline auto isValidOption( std::string const &option ) -> bool {
        if( startsWith( option, "--" ) )
            return std::all_of( option.begin() + 2, option.end(), []( char c ) {
                return std::isalnum( static_cast<unsigned char>( c ) ) || c == '-';
            } );
        if( startsWith( option, "-" ) )
            return std::all_of( option.begin() + 1, option.end(), []( char c ) {
                return std::isalpha( static_cast<unsigned char>( c ) ) != 0;
            } );
        return false;
    }

    inline auto applyCheck( Check const &check, RunState const &state, Arg const &arg, std::size_t ) -> bool {
        if( check.type == CheckType::Always )
            return true;

        // Sentinels carry no text, so no textual check can hold for them
        if( arg.isSentinel() )
            return false;

        auto const &token = arg.unwrapUser();
        switch( check.type ) {
            case CheckType::Always:
                return true;

            case CheckType::IsBatchOption:
                return !state.ignoreOptions
                    && startsWith( token, "-" )
                    && token.size() > 2
                    && std::all_of( token.begin() + 1, token.end(), [&]( char c ) {
                           return std::isalnum( static_cast<unsigned char>( c ) )
                               && check.options.count( std::string( 1, '-' ) + c ) > 0;
                       } );

            case CheckType::IsBoundOption: {
                if( state.ignoreOptions )
                    return false;
                auto delimiterPos = token.find( '=' );
                return delimiterPos != std::string::npos
                    && check.options.count( token.substr( 0, delimiterPos ) ) > 0;
            }

            case CheckType::IsExact:
            case CheckType::IsExactString:
                return !state.ignoreOptions && token == check.needle;

            case CheckType::IsHelp:
                return !state.ignoreOptions
                    && ( token == ARGOT_CONFIG_HELP_LONG
                      || token == ARGOT_CONFIG_HELP_SHORT
                      || startsWith( token, ARGOT_CONFIG_HELP_LONG "=" ) );

            case CheckType::IsNotOptionLike:
                return state.ignoreOptions || token == "-" || !startsWith( token, "-" );

            case CheckType::IsOptionLike:
                return !state.ignoreOptions && token != "-" && startsWith( token, "-" );

            case CheckType::IsUnsupportedOption:
                return !state.ignoreOptions
                    && startsWith( token, "-" )
                    && isValidOption( token )
                    && check.options.count( token ) == 0;

            case CheckType::IsInvalidOption:
                return !state.ignoreOptions
                    && startsWith( token, "-" )
                    && !isValidOption( token );
        }
        return false;
    }

    inline auto applyReducer( Reducer const &reducer, RunState const &state, Arg const &arg, std::size_t segmentIndex ) -> RunState {
        RunState next = state;

        switch( reducer.type ) {
            case ReducerType::None:
                break;

            case ReducerType::InhibateOptions:
                next.ignoreOptions = true;
                break;

            case ReducerType::PushBatch: {
                auto const &token = arg.unwrapUser();
                std::string name = "- ";
                for( std::size_t t = 1; t < token.size(); ++t ) {
                    name[1] = token[t];
                    next.options.emplace_back( name, OptionValue::boolean( true ) );
                    // Only the first option of the bundle owns the leading dash
                    next.pushToken( Token::option( segmentIndex, t == 1 ? Slice( 0, 2 ) : Slice( t, t + 1 ), name ) );
                }
                break;
            }

            case ReducerType::PushBound: {
                auto const &token = arg.unwrapUser();
                auto delimiterPos = token.find( '=' );
                enforce( delimiterPos != std::string::npos, "bound option has no '=' separator" );
                auto name = token.substr( 0, delimiterPos );
                next.options.emplace_back( name, OptionValue::string( token.substr( delimiterPos + 1 ) ) );
                next.pushToken( Token::option( segmentIndex, Slice( 0, delimiterPos ), name ) );
                next.pushToken( Token::assign( segmentIndex, Slice( delimiterPos, delimiterPos + 1 ) ) );
                next.pushToken( Token::value( segmentIndex, Slice( delimiterPos + 1, token.size() ) ) );
                break;
            }

            case ReducerType::PushExtra:
                next.positionals.push_back( Positional::optional( arg.unwrapUser() ) );
                break;

            case ReducerType::PushPositional:
                next.positionals.push_back( Positional::required( arg.unwrapUser() ) );
                break;

            case ReducerType::PushRest:
                next.positionals.push_back( Positional::rest( arg.unwrapUser() ) );
                break;

            case ReducerType::PushFalse:
                next.options.emplace_back( reducer.text, OptionValue::boolean( false ) );
                next.pushToken( Token::option( segmentIndex, std::nullopt, reducer.text ) );
                break;

            case ReducerType::PushTrue:
                next.options.emplace_back( reducer.text, OptionValue::boolean( true ) );
                next.pushToken( Token::option( segmentIndex, std::nullopt, reducer.text ) );
                break;

            case ReducerType::PushNone:
                next.options.emplace_back( reducer.text, OptionValue::none() );
                next.pushToken( Token::option( segmentIndex, std::nullopt, reducer.text ) );
                break;

            case ReducerType::PushPath:
                next.path.push_back( arg.unwrapUser() );
                break;

            case ReducerType::PushStringValue:
                next.lastOption().second.pushString( arg.unwrapUser() );
                next.pushToken( Token::value( segmentIndex, std::nullopt ) );
                break;

            case ReducerType::SetStringValue:
                next.lastOption().second = OptionValue::string( arg.unwrapUser() );
                next.pushToken( Token::value( segmentIndex, std::nullopt ) );
                break;

            case ReducerType::SetOptionArityError:
                next.errorMessage = "Not enough arguments to option " + state.lastOption().first + ".";
                break;

            case ReducerType::SetError:
                // Sentinels have no literal text to quote
                next.errorMessage = arg.isSentinel()
                    ? reducer.text + "."
                    : reducer.text + " (\"" + arg.unwrapUser() + "\").";
                break;

            case ReducerType::SetSelectedIndex:
                enforce( reducer.selection.has_value(), "SetSelectedIndex reducer carries no selection" );
                next.selectedIndex = reducer.selection;
                break;

            case ReducerType::UseHelp:
                next.options.clear();
                next.options.emplace_back( ARGOT_CONFIG_HELP_OPTION_NAME, OptionValue::string( std::to_string( reducer.helpIndex ) ) );
                break;

            case ReducerType::SetCandidateState:
                enforce( reducer.candidate != nullptr, "SetCandidateState reducer carries no candidate" );
                next.applySome( *reducer.candidate );
                break;
        }
        return next;
    }

    // The tokens produced by one argv element, in the order they were recorded
    inline auto tokensForSegment( RunState const &state, std::size_t segmentIndex ) -> std::vector<Token> {
        std::vector<Token> result;
        std::copy_if( state.tokens.begin(), state.tokens.end(), std::back_inserter( result ), [=]( Token const &token ) {
            return token.segmentIndex == segmentIndex;
        } );
        return result;
    }

    inline auto validateOptionName( std::string const &name ) -> Result {
        if( name.empty() )
            return Result::logicError( "Option name cannot be empty" );
        if( name[0] != '-' )
            return Result::logicError( "Option name must begin with '-'" );
        if( !isValidOption( name ) )
            return Result::logicError( "Invalid option name: " + name );
        return Result::ok();
    }

    inline auto validateOptionNames( OptionNames const &names ) -> Result {
        for( auto const &name : names ) {
            auto result = validateOptionName( name );
            if( !result )
                return result;
        }
        return Result::ok();
    }

    inline auto operator<<( std::ostream &os, Arg const &arg ) -> std::ostream& {
        switch( arg.type() ) {
            case Arg::Type::User:
                return os << '"' << arg.unwrapUser() << '"';
            case Arg::Type::EndOfInput:
                return os << "<end of input>";
            case Arg::Type::EndOfPartialInput:
                return os << "<end of partial input>";
        }
        return os;
    }

    inline auto operator<<( std::ostream &os, OptionValue const &value ) -> std::ostream& {
        switch( value.type() ) {
            case OptionValue::Type::None:
                return os << "None";
            case OptionValue::Type::Bool:
                return os << "Bool(" << ( value.boolValue() ? "true" : "false" ) << ")";
            case OptionValue::Type::String:
                return os << "String(\"" << value.stringValue() << "\")";
            case OptionValue::Type::Array: {
                os << "Array(";
                bool first = true;
                for( auto const &item : value.arrayValue() ) {
                    if( first )
                        first = false;
                    else
                        os << ", ";
                    os << '"' << item << '"';
                }
                return os << ")";
            }
        }
        return os;
    }

    inline auto operator<<( std::ostream &os, Positional const &positional ) -> std::ostream& {
        switch( positional.type ) {
            case Positional::Type::Required:
                os << "Required";
                break;
            case Positional::Type::Optional:
                os << "Optional";
                break;
            case Positional::Type::Rest:
                os << "Rest";
                break;
        }
        return os << "(\"" << positional.value << "\")";
    }

    inline auto operator<<( std::ostream &os, Token const &token ) -> std::ostream& {
        switch( token.type ) {
            case TokenType::Option:
                os << "Option(" << token.optionName << ", ";
                break;
            case TokenType::Assign:
                os << "Assign(";
                break;
            case TokenType::Value:
                os << "Value(";
                break;
        }
        os << "segment " << token.segmentIndex;
        if( token.slice )
            os << ", " << token.slice->first << ".." << token.slice->second;
        return os << ")";
    }

    inline auto operator<<( std::ostream &os, Selection const &selection ) -> std::ostream& {
        switch( selection.type() ) {
            case Selection::Type::Command:
                return os << "command " << selection.commandIndex();
            case Selection::Type::HelpRequest:
                return os << "help";
        }
        return os;
    }

    inline auto operator<<( std::ostream &os, OptionNames const &names ) -> std::ostream& {
        os << "{";
        bool first = true;
        for( auto const &name : names ) {
            if( first )
                first = false;
            else
                os << ", ";
            os << name;
        }
        return os << "}";
    }

    inline auto operator<<( std::ostream &os, Check const &check ) -> std::ostream& {
        switch( check.type ) {
            case CheckType::Always:
                return os << "Always";
            case CheckType::IsBatchOption:
                return os << "IsBatchOption(" << check.options << ")";
            case CheckType::IsBoundOption:
                return os << "IsBoundOption(" << check.options << ")";
            case CheckType::IsExact:
                return os << "IsExact(\"" << check.needle << "\")";
            case CheckType::IsExactString:
                return os << "IsExactString(\"" << check.needle << "\")";
            case CheckType::IsHelp:
                return os << "IsHelp";
            case CheckType::IsNotOptionLike:
                return os << "IsNotOptionLike";
            case CheckType::IsOptionLike:
                return os << "IsOptionLike";
            case CheckType::IsUnsupportedOption:
                return os << "IsUnsupportedOption(" << check.options << ")";
            case CheckType::IsInvalidOption:
                return os << "IsInvalidOption";
        }
        return os;
    }

    inline auto operator<<( std::ostream &os, Reducer const &reducer ) -> std::ostream& {
        switch( reducer.type ) {
            case ReducerType::None:
                return os << "None";
            case ReducerType::InhibateOptions:
                return os << "InhibateOptions";
            case ReducerType::PushBatch:
                return os << "PushBatch";
            case ReducerType::PushBound:
                return os << "PushBound";
            case ReducerType::PushExtra:
                return os << "PushExtra";
            case ReducerType::PushFalse:
                return os << "PushFalse(" << reducer.text << ")";
            case ReducerType::PushNone:
                return os << "PushNone(" << reducer.text << ")";
            case ReducerType::PushPath:
                return os << "PushPath";
            case ReducerType::PushPositional:
                return os << "PushPositional";
            case ReducerType::PushRest:
                return os << "PushRest";
            case ReducerType::PushStringValue:
                return os << "PushStringValue";
            case ReducerType::PushTrue:
                return os << "PushTrue(" << reducer.text << ")";
            case ReducerType::SetCandidateState:
                return os << "SetCandidateState";
            case ReducerType::SetError:
                return os << "SetError(\"" << reducer.text << "\")";
            case ReducerType::SetOptionArityError:
                return os << "SetOptionArityError";
            case ReducerType::SetSelectedIndex:
                os << "SetSelectedIndex(";
                if( reducer.selection )
                    os << *reducer.selection;
                return os << ")";
            case ReducerType::SetStringValue:
                return os << "SetStringValue";
            case ReducerType::UseHelp:
                return os << "UseHelp(" << reducer.helpIndex << ")";
        }
        return os;
    }

    inline auto operator<<( std::ostream &os, RunState const &state ) -> std::ostream& {
        os << "RunState{";
        if( state.ignoreOptions )
            os << " ignoreOptions";
        if( !state.path.empty() ) {
            os << " path:";
            for( auto const &segment : state.path )
                os << ' ' << segment;
        }
        for( auto const &option : state.options )
            os << ' ' << option.first << '=' << option.second;
        for( auto const &positional : state.positionals )
            os << ' ' << positional;
        if( state.selectedIndex )
            os << " selected: " << *state.selectedIndex;
        if( state.errorMessage )
            os << " error: \"" << *state.errorMessage << '"';
        return os << " }";
    }

} // namespace detail

// Unit of input consumed per step
using detail::Arg;

// Parse state, and the overlay used to adopt an explored candidate
using detail::RunState;
using detail::PartialRunState;

using detail::OptionValue;
using detail::OptionBinding;
using detail::OptionNames;
using detail::Positional;
using detail::Selection;
using detail::Slice;
using detail::Token;
using detail::TokenType;

// Transition guards and actions
using detail::Check;
using detail::CheckType;
using detail::Reducer;
using detail::ReducerType;
using detail::applyCheck;
using detail::applyReducer;

using detail::isValidOption;
using detail::tokensForSegment;
using detail::validateOptionName;
using detail::validateOptionNames;

// Result type for definition-time validation
using detail::Result;

} // namespace argot

#endif // ARGOT_HPP_INCLUDED

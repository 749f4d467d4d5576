#ifndef ARGOT_TEST_HELPERS_HPP_INCLUDED
#define ARGOT_TEST_HELPERS_HPP_INCLUDED

#include "argot.hpp"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>

namespace Catch {
template<>
struct StringMaker<argot::OptionBinding> {
    static std::string convert( argot::OptionBinding const& binding ) {
        std::ostringstream oss;
        oss << "(" << binding.first << ", " << binding.second << ")";
        return oss.str();
    }
};
}

template<typename T>
std::string toString( T const& value ) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

#endif // ARGOT_TEST_HELPERS_HPP_INCLUDED

#pragma once
#include <optional>
#include <string>
#include <utility>
#include "error.hpp"


namespace bitleech {

    template <typename T>
    struct Expected 
    {
        std::optional<T> value;
        std::optional<Error> error;


        static Expected success(T v) { 
            Expected e; e.value = std::move(v); 
            return e; 
        }
        static Expected failure(ErrorCode code, std::string msg) { 
            Expected e; e.error = Error{code, std::move(msg)}; 
            return e;
        }
        static Expected failure(Error err) {
            Expected e; e.error = std::move(err);
            return e;
        }
        bool has_value() const { return value.has_value(); }
        explicit operator bool() const { return has_value(); }
        T& get() { return *value; }
        const T& get() const { return *value; }
    };


    template <>
    struct Expected<void> 
    {
        std::optional<Error> error;
        static Expected success() { return {}; }
        static Expected failure(ErrorCode code, std::string msg) { Expected e; e.error = Error{code, std::move(msg)}; return e; }
        static Expected failure(Error err) { Expected e; e.error = std::move(err); return e; }
        bool has_value() const { return !error.has_value(); }
        explicit operator bool() const { return has_value(); }
    };


} // namespace bitleech

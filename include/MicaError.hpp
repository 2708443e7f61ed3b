#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Base of every error the interpreter raises. what() carries the full,
// human-readable diagnostic; the accessors expose the pieces.
class MicaError : public std::runtime_error {
   public:
    MicaError(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(type, message, loc)),
                                    type_(type),
                                    message_(message),
                                    loc_(loc) {}

    const std::string& type() const { return type_; }
    const std::string& message() const { return message_; }
    const TokenLocation& location() const { return loc_; }

   private:
    std::string type_;
    std::string message_;
    TokenLocation loc_;

    static std::string format_message(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) {
        if (!loc.known()) {
            return type + ": " + message;
        }
        std::string out = type + " at " + loc.to_string() + "\n" + message;
        if (loc.src_mgr) {
            out += "\n --> Traced at:\n" + loc.get_line_trace();
        }
        return out;
    }
};

// Location used when an error has no source position (environment API calls).
inline TokenLocation no_location() {
    return TokenLocation("", 0, 0, 0);
}

class LexError : public MicaError {
   public:
    enum class Kind {
        UnexpectedCharacter
    };

    LexError(Kind kind, const std::string& character, const TokenLocation& loc)
        : MicaError("LexError", "Unexpected character '" + character + "'", loc),
          kind_(kind),
          character_(character) {}

    Kind kind() const { return kind_; }
    // The offending character, as UTF-8 text.
    const std::string& character() const { return character_; }

   private:
    Kind kind_;
    std::string character_;
};

class ParseError : public MicaError {
   public:
    enum class Kind {
        ExpectedToken,
        UnexpectedEndOfInput,
        UnsupportedTokenType,
        DotWithoutIdentifier,
        ConstValueRequired,
        ParameterNotIdentifier,
        NestingTooDeep
    };

    ParseError(Kind kind, const std::string& message, const TokenLocation& loc)
        : MicaError("ParseError", message, loc), kind_(kind) {}

    // Expected-vs-actual mismatch; `context` says what was being parsed.
    ParseError(TokenType expected, TokenType actual, const std::string& context, const TokenLocation& loc)
        : MicaError("ParseError",
              context + " (expected " + token_type_name(expected) + ", got " + token_type_name(actual) + ")",
              loc),
          kind_(Kind::ExpectedToken),
          expected_(expected),
          actual_(actual),
          has_tokens_(true) {}

    Kind kind() const { return kind_; }
    bool has_token_types() const { return has_tokens_; }
    TokenType expected() const { return expected_; }
    TokenType actual() const { return actual_; }

   private:
    Kind kind_;
    TokenType expected_ = TokenType::EOF_TOKEN;
    TokenType actual_ = TokenType::EOF_TOKEN;
    bool has_tokens_ = false;
};

class EnvError : public MicaError {
   public:
    enum class Kind {
        RedeclareVariable,
        ReassignVariable,
        VariableNotFound
    };

    EnvError(Kind kind, const std::string& name, const TokenLocation& loc = no_location())
        : MicaError("EnvError", describe(kind, name), loc), kind_(kind), name_(name) {}

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }

   private:
    Kind kind_;
    std::string name_;

    static std::string describe(Kind kind, const std::string& name) {
        switch (kind) {
            case Kind::RedeclareVariable:
                return "Cannot redeclare variable '" + name + "'";
            case Kind::ReassignVariable:
                return "Cannot reassign to constant '" + name + "'";
            case Kind::VariableNotFound:
                return "Cannot resolve '" + name + "' since it doesn't exist";
        }
        return name;
    }
};

class EvalError : public MicaError {
   public:
    enum class Kind {
        UnexpectedStatement,
        InvalidAssignment,
        InvalidOperator,
        ValueNotAFunction,
        ArityMismatch,
        DivisionByZero,
        NumberOutOfRange,
        IntegerOverflow,
        CallDepthExceeded,
        EvaluationTooDeep
    };

    EvalError(Kind kind, const std::string& message, const TokenLocation& loc)
        : MicaError("EvalError", message, loc), kind_(kind) {}

    Kind kind() const { return kind_; }

   private:
    Kind kind_;
};

#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>



namespace bitleech::bencode {

    class BencodeValue 
    {
    public:
        enum class Type { None, Int, String, List, Dict };

        using List = std::vector<BencodeValue>;
        using Dict = std::map<std::string, BencodeValue>;   // byte-wise key order == bencode order

        BencodeValue();
        BencodeValue(int64_t i);
        BencodeValue(const char* s);
        BencodeValue(const std::string& s);
        BencodeValue(std::string&& s);
        BencodeValue(const List& l);
        BencodeValue(List&& l);
        BencodeValue(const Dict& d);
        BencodeValue(Dict&& d);


        bool isInt() const noexcept;
        bool isString() const noexcept;
        bool isList() const noexcept;
        bool isDict() const noexcept;


        int64_t asInt() const;
        const std::string& asString() const;
        const List& asList() const;
        const Dict& asDict() const;

        // nullptr when this is not a dict or the key is absent
        const BencodeValue* find(std::string_view key) const;

        Type type() const noexcept { return type_; }

        friend bool operator==(const BencodeValue& a, const BencodeValue& b);

    private:
        Type type_{Type::None};
        int64_t intValue_{0};
        std::string strValue_;
        List listValue_;
        Dict dictValue_;
    };

    struct ParseResult 
    {
        BencodeValue root;
        std::optional<std::string_view> slice;   // exact source bytes of the requested top-level value
    };


    class BencodeParser 
    {
    public:
        static constexpr std::size_t kMaxDepth = 256;

        // All three throw bitleech::ParseError(MalformedBencode).
        static BencodeValue parse(std::string_view input);
        static ParseResult parseWithSlice(std::string_view input, std::string_view key);
        static ParseResult parseWithInfoSlice(std::string_view input) { return parseWithSlice(input, "info"); }

        static std::string encode(const BencodeValue& val);

    private:

        explicit BencodeParser(std::string_view input);

        // Recursive Descent
        BencodeValue parseValue();
        BencodeValue parseInt();
        BencodeValue parseString();
        BencodeValue parseList();
        BencodeValue parseDict();

        char peek() const;
        char get();
        void expect(char c);

        std::string_view input_;
        size_t pos_{0};
        size_t depth_{0};

        struct Span { size_t begin{}, end{}; };
        std::optional<std::string> sliceKey_;
        std::optional<Span> slice_;
    };


} // namespace bitleech::bencode

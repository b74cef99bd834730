#include "bencode.hpp"
#include <stdexcept>
#include <limits>
#include <sstream>
#include "../common/include/error.hpp"

namespace bitleech::bencode {

    // ---------- BencodeValue ----------

    BencodeValue::BencodeValue() : type_(Type::None) {}

    BencodeValue::BencodeValue(int64_t i) : type_(Type::Int), intValue_(i) {}

    BencodeValue::BencodeValue(const char* s) : type_(Type::String), strValue_(s) {}

    BencodeValue::BencodeValue(const std::string& s) : type_(Type::String), strValue_(s) {}

    BencodeValue::BencodeValue(std::string&& s) : type_(Type::String), strValue_(std::move(s)) {}

    BencodeValue::BencodeValue(const List& l) : type_(Type::List), listValue_(l) {}

    BencodeValue::BencodeValue(List&& l) : type_(Type::List), listValue_(std::move(l)) {}

    BencodeValue::BencodeValue(const Dict& d) : type_(Type::Dict), dictValue_(d) {}

    BencodeValue::BencodeValue(Dict&& d) : type_(Type::Dict), dictValue_(std::move(d)) {}

    bool BencodeValue::isInt()    const noexcept { return type_ == Type::Int; }
    bool BencodeValue::isString() const noexcept { return type_ == Type::String; }
    bool BencodeValue::isList()   const noexcept { return type_ == Type::List; }
    bool BencodeValue::isDict()   const noexcept { return type_ == Type::Dict; }

    int64_t BencodeValue::asInt() const {
        if (!isInt()) throw std::runtime_error("BencodeValue: not an int");
        return intValue_;
    }

    const std::string& BencodeValue::asString() const {
        if (!isString()) throw std::runtime_error("BencodeValue: not a string");
        return strValue_;
    }

    const BencodeValue::List& BencodeValue::asList() const {
        if (!isList()) throw std::runtime_error("BencodeValue: not a list");
        return listValue_;
    }

    const BencodeValue::Dict& BencodeValue::asDict() const {
        if (!isDict()) throw std::runtime_error("BencodeValue: not a dict");
        return dictValue_;
    }

    const BencodeValue* BencodeValue::find(std::string_view key) const {
        if (!isDict()) return nullptr;
        auto it = dictValue_.find(std::string(key));
        return it == dictValue_.end() ? nullptr : &it->second;
    }

    bool operator==(const BencodeValue& a, const BencodeValue& b) {
        if (a.type_ != b.type_) return false;
        switch (a.type_) {
            case BencodeValue::Type::None:   return true;
            case BencodeValue::Type::Int:    return a.intValue_ == b.intValue_;
            case BencodeValue::Type::String: return a.strValue_ == b.strValue_;
            case BencodeValue::Type::List:   return a.listValue_ == b.listValue_;
            case BencodeValue::Type::Dict:   return a.dictValue_ == b.dictValue_;
        }
        return false;
    }





    // ---------- BencodeParser ----------

    static ParseError parse_error(const char* msg, size_t pos) {
        std::ostringstream oss;
        oss << "bencode parse error at " << pos << ": " << msg;
        return ParseError(ErrorCode::MalformedBencode, oss.str());
    }

    BencodeParser::BencodeParser(std::string_view input) : input_(input), pos_(0) {}

    static void ensure_not_eof(std::string_view s, size_t pos) {
        if (pos >= s.size()) throw parse_error("unexpected end of input", pos);
    }

    char BencodeParser::peek() const {
        ensure_not_eof(input_, pos_);
        return input_[pos_];
    }

    char BencodeParser::get() {
        ensure_not_eof(input_, pos_);
        return input_[pos_++];
    }

    void BencodeParser::expect(char c) {
        char g = get();
        if (g != c) throw parse_error("unexpected character", pos_ - 1);
    }

    BencodeValue BencodeParser::parseValue() {
        char c = peek();
        if (c == 'i') return parseInt();
        if (c >= '0' && c <= '9') return parseString();
        if (c != 'l' && c != 'd') throw parse_error("invalid value prefix", pos_);

        if (++depth_ > kMaxDepth) throw parse_error("nesting too deep", pos_);
        BencodeValue v = (c == 'l') ? parseList() : parseDict();
        --depth_;
        return v;
    }


    BencodeValue BencodeParser::parseInt() {
        expect('i');
        bool neg = false;
        if (peek() == '-') { get(); neg = true; }

        if (!(peek() >= '0' && peek() <= '9')) {
            throw parse_error("integer missing digits", pos_);
        }

        // Leading zero rules (allow "i0e", forbid "-0", forbid leading zeros)
        if (peek() == '0') {
            get();
            if (peek() != 'e') throw parse_error("leading zero in integer", pos_);
            get();
            if (neg) throw parse_error("negative zero not allowed", pos_ - 2);
            return BencodeValue(int64_t(0));
        }

        uint64_t mag = 0;
        while (peek() >= '0' && peek() <= '9') {
            int d = get() - '0';
            if (mag > (std::numeric_limits<uint64_t>::max() - uint64_t(d)) / 10ULL) {
                throw parse_error("integer overflow", pos_);
            }
            mag = mag * 10ULL + uint64_t(d);
        }
        expect('e');

        if (!neg) {
            if (mag > uint64_t(std::numeric_limits<int64_t>::max()))
                throw parse_error("integer overflow", pos_);
            return BencodeValue(static_cast<int64_t>(mag));
        } else {
            constexpr uint64_t ABS_INT64_MIN = uint64_t(1) << 63;

            if (mag == ABS_INT64_MIN) return BencodeValue(std::numeric_limits<int64_t>::min());
            if (mag > uint64_t(std::numeric_limits<int64_t>::max())) throw parse_error("integer overflow", pos_);
            return BencodeValue(-static_cast<int64_t>(mag));
        }
    }


    BencodeValue BencodeParser::parseString() {
        size_t len = 0;

        if (peek() == '0') {
            get();
            expect(':');
            return BencodeValue(std::string{});
        }

        if (!(peek() >= '1' && peek() <= '9')) {
            throw parse_error("invalid string length start", pos_);
        }
        while (peek() >= '0' && peek() <= '9') {
            int d = get() - '0';
            if (len > (std::numeric_limits<size_t>::max() - size_t(d)) / 10) {
                throw parse_error("string length overflow", pos_);
            }
            len = len * 10 + size_t(d);
        }

        expect(':');

        if (input_.size() - pos_ < len) {
            throw parse_error("string length exceeds input", pos_);
        }
        std::string out;
        out.assign(input_.substr(pos_, len));
        pos_ += len;
        return BencodeValue(std::move(out));
    }

    BencodeValue BencodeParser::parseList() {
        expect('l');
        BencodeValue::List lst;
        while (peek() != 'e') {
            lst.push_back(parseValue());
        }
        expect('e');
        return BencodeValue(std::move(lst));
    }

    BencodeValue BencodeParser::parseDict() {
        expect('d');
        const bool topLevel = (depth_ == 1);
        BencodeValue::Dict dict;
        std::optional<std::string> last_key;

        while (peek() != 'e') {
            if (!(peek() >= '0' && peek() <= '9')) throw parse_error("dict key is not a string", pos_);

            size_t key_pos = pos_;
            BencodeValue key = parseString();
            const std::string& k = key.asString();

            // std::string compares bytes as unsigned char, which is bencode key order
            if (last_key) {
                int cmp = last_key->compare(k);
                if (cmp == 0) throw parse_error("duplicate dict key", key_pos);
                if (cmp > 0) throw parse_error("dict keys out of order", key_pos);
            }

            size_t val_begin = pos_;
            BencodeValue val = parseValue();
            size_t val_end = pos_;

            if (topLevel && sliceKey_ && k == *sliceKey_) {
                slice_ = Span{val_begin, val_end};
            }

            last_key = k;
            dict.emplace(k, std::move(val));
        }

        expect('e');
        return BencodeValue(std::move(dict));
    }



    BencodeValue BencodeParser::parse(std::string_view input) {

        BencodeParser p(input);
        BencodeValue v = p.parseValue();

        if (p.pos_ != input.size()) {
            throw parse_error("trailing data after valid bencode", p.pos_);
        }
        return v;
    }

    ParseResult BencodeParser::parseWithSlice(std::string_view input, std::string_view key) {

        BencodeParser p(input);
        p.sliceKey_ = std::string(key);
        BencodeValue v = p.parseValue();

        if (p.pos_ != input.size()) {
            throw parse_error("trailing data after valid bencode", p.pos_);
        }

        ParseResult r{std::move(v), std::nullopt};
        if (p.slice_) {
            r.slice = input.substr(p.slice_->begin, p.slice_->end - p.slice_->begin);
        }
        return r;
    }

    // ---- Encoder ----

    static void encode_impl(const BencodeValue& v, std::string& out);

    static void encode_int(int64_t x, std::string& out) {
        out.push_back('i');
        out += std::to_string(x);
        out.push_back('e');
    }

    static void encode_string(const std::string& s, std::string& out) {
        out += std::to_string(s.size());
        out.push_back(':');
        out.append(s.data(), s.size());
    }

    static void encode_list(const BencodeValue::List& lst, std::string& out) {
        out.push_back('l');
        for (const auto& e : lst) encode_impl(e, out);
        out.push_back('e');
    }

    static void encode_dict(const BencodeValue::Dict& dict, std::string& out) {
        out.push_back('d');
        for (const auto& kv : dict) {
            encode_string(kv.first, out);
            encode_impl(kv.second, out);
        }
        out.push_back('e');
    }

    static void encode_impl(const BencodeValue& v, std::string& out) {

        switch (v.type()) {
            case BencodeValue::Type::None:
                throw std::invalid_argument("cannot encode None");
            case BencodeValue::Type::Int:
                encode_int(v.asInt(), out);
                break;
            case BencodeValue::Type::String:
                encode_string(v.asString(), out);
                break;
            case BencodeValue::Type::List:
                encode_list(v.asList(), out);
                break;
            case BencodeValue::Type::Dict:
                encode_dict(v.asDict(), out);
                break;
        }
    }

    std::string BencodeParser::encode(const BencodeValue& val) {
        std::string out;
        out.reserve(256);
        encode_impl(val, out);
        return out;
    }

} // namespace bitleech::bencode

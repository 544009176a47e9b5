#pragma once
// 例外（obf::Error を基底とする）
#include <stdexcept>
#include <string>

namespace obf {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// 引数が範囲外（通信前に送出）
class RangeError : public Error {
public:
    RangeError(const std::string& field, double lower, double upper, double value,
               const std::string& what)
        : Error(what), field_(field), lower_(lower), upper_(upper), value_(value) {}

    const std::string& field() const { return field_; }
    double lower() const { return lower_; }
    double upper() const { return upper_; }
    double value() const { return value_; }

private:
    std::string field_;
    double lower_, upper_, value_;
};

// 応答の先頭文字が期待と異なる（raw = 受信文字列そのもの）
class ProtocolViolation : public Error {
public:
    ProtocolViolation(const std::string& what, const std::string& raw)
        : Error(what), raw_(raw) {}
    const std::string& raw() const { return raw_; }
private:
    std::string raw_;
};

// データ部を数値/文字列として解釈できない
class DecodeError : public ProtocolViolation {
public:
    using ProtocolViolation::ProtocolViolation;
};

// 送信失敗・ポート未オープン
class TransportError : public Error {
public:
    using Error::Error;
};

// スキャン中のフレーム数/経過時間が上限を超えた
class SweepTimeout : public Error {
public:
    using Error::Error;
};

} // namespace obf

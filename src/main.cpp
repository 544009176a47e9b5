// 1) シリアルポート一覧表示
// 2) 全ポートへ識別問い合わせ → 光フィルタを検出
// 3) メニュー: スキャン / 波長設定 / 送受信トレース切替 / 終了

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#endif
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

#include "../include/serial_port.hpp"
#include "../include/obf_protocol.hpp"

//----------------------------------------------
static int ask_number(const std::string& prompt, int minVal, int maxVal, int defVal) {
    while (true) {
        std::cout << prompt;
        std::string s; std::getline(std::cin, s);
        if (s.empty()) return defVal;
        try {
            int v = std::stoi(s);
            if (v < minVal || v > maxVal) { std::cout<<"範囲外です。\n"; continue; }
            return v;
        } catch (const std::logic_error&) { std::cout<<"数字で入力してください。\n"; }
    }
}
// 範囲チェックはプロトコル層に任せる
static double ask_real(const std::string& prompt, double defVal) {
    while (true) {
        std::cout << prompt;
        std::string s; std::getline(std::cin, s);
        if (s.empty()) return defVal;
        try {
            return std::stod(s);
        } catch (const std::logic_error&) { std::cout<<"数値で入力してください。\n"; }
    }
}
//----------------------------------------------
static void do_scan(obf::Transport& dev) {
    obf::ScanParameters p;
    p.start = ask_number("開始波長 nm（Enterで1510）: ", 0, 9999, obf::WAVELENGTH_MIN);
    p.end   = ask_number("終了波長 nm（Enterで1589）: ", 0, 9999, obf::WAVELENGTH_MAX);
    p.stay  = ask_real  ("滞在時間 s（Enterで1.0）: ", 1.0);
    p.span  = ask_number("スパン（Enterで1）: ", 0, 9999, 1);

    try {
        const obf::PreviousScanSettings prev = obf::scan(dev, p);
        std::cout << "=== 変更前の設定 ===\n";
        std::cout << "  開始波長 : " << prev.start << " nm\n";
        std::cout << "  終了波長 : " << prev.end   << " nm\n";
        std::cout << "  滞在時間 : " << prev.stay  << " s\n";
    } catch (const obf::Error& e) {
        std::cerr << "スキャン失敗: " << e.what() << "\n";
    }
}

static void do_set_channel(obf::Transport& dev) {
    const double wl = ask_real("波長 nm（Enterで1550.0）: ", 1550.0);
    if (obf::set_channel(dev, wl) == 0) std::cout << "波長を設定しました。\n";
    else                                std::cerr << "波長の設定に失敗しました。\n";
}
//----------------------------------------------
int main(int, char**) {
#ifdef _WIN32
    ::SetConsoleOutputCP(CP_UTF8);
#endif
    // === ポート一覧 ===
    auto ports = obf::list_serial_ports();
    if (ports.empty()) { std::cerr << "シリアルポートが見つかりません。\n"; return 1; }
    std::cout << "=== 利用可能なシリアルポート ===\n";
    for (size_t i=0;i<ports.size();++i) std::cout<<"  ["<<i<<"] "<<ports[i]<<"\n";

    // === 検出 ===
    obf::DiscoveryOptions opt;
    std::unique_ptr<obf::Transport> dev = obf::discover(ports, opt, obf::open_serial);
    if (!dev) return 2;
    std::cout << "接続: " << dev->name() << "\n";

    // === メニュー ===
    while (true) {
        std::cout << "\n=== 操作（トレース: " << (obf::trace_enabled() ? "ON" : "OFF") << "） ===\n"
                  << "  [0] スキャン\n"
                  << "  [1] 波長設定\n"
                  << "  [2] 送受信トレース切替\n"
                  << "  [3] 終了\n";
        int m = ask_number("番号を入力: ", 0, 3, 3);
        switch (m) {
            case 0: do_scan(*dev); break;
            case 1: do_set_channel(*dev); break;
            case 2: obf::set_trace(!obf::trace_enabled()); break;
            default: return 0;
        }
    }
}

#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"

#include <QChar>
#include <QString>

#include <string>
#include <vector>

namespace {
bool is_combining_mark(char32_t ch) {
    const auto category = QChar::category(ch);
    return category == QChar::Mark_NonSpacing || category == QChar::Mark_SpacingCombining;
}

bool only_letters_and_numbers(const std::string& value) {
    const QString decoded = QString::fromUtf8(value.data(), static_cast<qsizetype>(value.size()));
    for (const auto code_point : decoded.toUcs4()) {
        const auto ch = static_cast<char32_t>(code_point);
        if (!QChar::isLetterOrNumber(ch) && !is_combining_mark(ch)) {
            return false;
        }
    }
    return !decoded.isEmpty();
}
}

TEST_CASE("sanitize_category falls back to Other when nothing survives") {
    CHECK(Utils::sanitize_category("") == "Other");
    CHECK(Utils::sanitize_category("!!!") == "Other");
    CHECK(Utils::sanitize_category("  \t\n") == "Other");
    CHECK(Utils::sanitize_category("../") == "Other");
}

TEST_CASE("sanitize_category strips punctuation and whitespace") {
    CHECK(Utils::sanitize_category("My Invoices 2024!") == "MyInvoices2024");
    CHECK(Utils::sanitize_category("Images/Photos") == "ImagesPhotos");
    CHECK(Utils::sanitize_category("..\\..\\etc") == "etc");
}

TEST_CASE("sanitize_category preserves casing") {
    CHECK(Utils::sanitize_category("mUsIc") == "mUsIc");
    CHECK(Utils::sanitize_category("PDF Documents") == "PDFDocuments");
}

TEST_CASE("sanitize_category keeps non-Latin letters and digits") {
    CHECK(Utils::sanitize_category("音楽 (J-Pop)") == "音楽JPop");
    CHECK(Utils::sanitize_category("Фото 2023") == "Фото2023");
    CHECK(Utils::sanitize_category("Café ☕") == "Café");
}

TEST_CASE("sanitize_category keeps vowel signs and other marks inside words") {
    // Hindi "music": SA, ANUSVARA (Mn), GA, VOWEL SIGN II (Mc), TA
    CHECK(Utils::sanitize_category("संगीत") == "संगीत");
    CHECK(Utils::sanitize_category("संगीत / गाने") == "संगीतगाने");
    CHECK(Utils::sanitize_category("தமிழ் பாடல்கள்") == "தமிழ்பாடல்கள்");
}

TEST_CASE("sanitize_category drops marks that do not follow a letter") {
    CHECK(Utils::sanitize_category("\u0301Docs") == "Docs");
    CHECK(Utils::sanitize_category("- \u0902") == "Other");
    CHECK(Utils::sanitize_category("2024\u0301") == "2024");
}

TEST_CASE("is_valid_utf8 rejects malformed byte sequences") {
    CHECK(Utils::is_valid_utf8("plain.txt"));
    CHECK(Utils::is_valid_utf8("曲.mp3"));
    CHECK(Utils::is_valid_utf8(""));
    CHECK_FALSE(Utils::is_valid_utf8(std::string("caf\xE9.txt")));
    CHECK_FALSE(Utils::is_valid_utf8(std::string("\xC3")));
}

TEST_CASE("sanitize_category output is always alphanumeric") {
    const std::vector<std::string> inputs = {
        "", " ", "a b", "§±!@#$%^&*()", "tab\tseparated", "emoji 🎵 music",
        "mixed-日本語_text.v2", "संगीत", "\u0301\u0302", std::string("\xff\xfe broken utf8"), "Other"
    };
    for (const auto& input : inputs) {
        INFO("input: " << input);
        CHECK(only_letters_and_numbers(Utils::sanitize_category(input)));
    }
}

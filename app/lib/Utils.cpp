#include "Utils.hpp"

#include <QByteArray>
#include <QChar>
#include <QString>
#include <QByteArrayView>
#include <QStringDecoder>

#include <cstdlib>
#include <vector>

namespace {
constexpr const char* kAppName = "LlmSort";
constexpr const char* kConfigDirEnv = "LLMSORT_CONFIG_DIR";
}

namespace Utils {

std::filesystem::path utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    std::u8string u8(value.begin(), value.end());
    return std::filesystem::path(u8);
#else
    return std::filesystem::path(value);
#endif
}


std::string path_to_utf8(const std::filesystem::path& path)
{
#ifdef _WIN32
    const std::u8string u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
#else
    return path.string();
#endif
}


bool is_valid_utf8(const std::string& value)
{
    QStringDecoder decoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
    const QString decoded = decoder.decode(QByteArrayView(value.data(), static_cast<qsizetype>(value.size())));
    return !decoder.hasError();
}


std::string sanitize_category(const std::string& raw)
{
    // Invalid UTF-8 decodes to U+FFFD, which is a symbol and gets dropped.
    const QString decoded = QString::fromUtf8(raw.data(), static_cast<qsizetype>(raw.size()));

    std::vector<char32_t> kept;
    kept.reserve(static_cast<std::size_t>(decoded.size()));
    // Combining marks stay only while they extend a kept letter (vowel signs, anusvara).
    bool extends_letter = false;
    for (const auto code_point : decoded.toUcs4()) {
        const auto ch = static_cast<char32_t>(code_point);
        const auto category = QChar::category(ch);
        const bool is_mark = category == QChar::Mark_NonSpacing ||
                             category == QChar::Mark_SpacingCombining;
        if (QChar::isLetterOrNumber(ch)) {
            kept.push_back(ch);
            extends_letter = QChar::isLetter(ch);
        } else if (is_mark && extends_letter) {
            kept.push_back(ch);
        } else {
            extends_letter = false;
        }
    }

    if (kept.empty()) {
        return kFallbackCategory;
    }

    const QByteArray utf8 =
        QString::fromUcs4(kept.data(), static_cast<qsizetype>(kept.size())).toUtf8();
    return std::string(utf8.constData(), static_cast<std::size_t>(utf8.size()));
}


std::string trim_copy(const std::string& input)
{
    const auto begin = input.find_first_not_of(" \t\n\r\f\v");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\n\r\f\v");
    return input.substr(begin, end - begin + 1);
}


std::filesystem::path get_app_config_dir()
{
    if (const char* override_root = std::getenv(kConfigDirEnv)) {
        if (*override_root != '\0') {
            return utf8_to_path(override_root) / kAppName;
        }
    }
#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        return utf8_to_path(app_data) / kAppName;
    }
#else
    if (const char* home = std::getenv("HOME")) {
        return utf8_to_path(home) / ".config" / kAppName;
    }
#endif
    return std::filesystem::current_path() / kAppName;
}

} // namespace Utils

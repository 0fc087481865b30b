module;
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>

module Graphics:Importers.Slime.Impl;
import :Importers.Slime;
import :IORegistry;
import :AssetErrors;
import :SlimeAsset;
import Core;

namespace Graphics
{
    namespace
    {
        static constexpr std::string_view s_Extensions[] = { ".slime" };

        static constexpr std::string_view kStructName = "Slime";
        static constexpr std::string_view kValueField = "value";
        static constexpr std::string_view kPaddingFields[] = { "_padding0", "_padding1", "_padding2" };

        // Cursor over the source text. Every Expect/Read skips leading trivia.
        class SlimeReader
        {
        public:
            explicit SlimeReader(std::string_view text) : m_Text(text) {}

            [[nodiscard]] bool AtEnd()
            {
                return SkipTrivia() && m_Pos == m_Text.size();
            }

            [[nodiscard]] bool Peek(char c)
            {
                return SkipTrivia() && m_Pos < m_Text.size() && m_Text[m_Pos] == c;
            }

            [[nodiscard]] bool Expect(char c)
            {
                if (!Peek(c)) return false;
                ++m_Pos;
                return true;
            }

            [[nodiscard]] std::optional<std::string_view> ReadIdentifier()
            {
                if (!SkipTrivia() || m_Pos >= m_Text.size()) return std::nullopt;

                const size_t start = m_Pos;
                auto isStart = [](unsigned char c) { return std::isalpha(c) || c == '_'; };
                auto isBody = [](unsigned char c) { return std::isalnum(c) || c == '_'; };

                if (!isStart(static_cast<unsigned char>(m_Text[m_Pos]))) return std::nullopt;
                while (m_Pos < m_Text.size() && isBody(static_cast<unsigned char>(m_Text[m_Pos])))
                    ++m_Pos;
                return m_Text.substr(start, m_Pos - start);
            }

            // Finite decimal float. inf/nan and out-of-range literals are rejected.
            [[nodiscard]] std::optional<float> ReadFloat()
            {
                if (!SkipTrivia() || m_Pos >= m_Text.size()) return std::nullopt;

                const size_t start = m_Pos;
                auto isNumberChar = [](char c)
                {
                    return (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
                };
                while (m_Pos < m_Text.size() && isNumberChar(m_Text[m_Pos]))
                    ++m_Pos;

                std::string_view token = m_Text.substr(start, m_Pos - start);
                if (token.size() > 1 && token.front() == '+') token.remove_prefix(1);
                if (token.empty() || token.front() == '+') return std::nullopt;

                float value = 0.0f;
                const char* first = token.data();
                const char* last = token.data() + token.size();
                auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
                if (ec != std::errc{} || ptr != last || !std::isfinite(value))
                    return std::nullopt;
                return value;
            }

            // Consumes one value of any shape: number, identifier or unit
            // variant, string, or a bracketed group (optionally named).
            [[nodiscard]] bool SkipValue()
            {
                if (!SkipTrivia() || m_Pos >= m_Text.size()) return false;

                const char c = m_Text[m_Pos];
                if (c == '"') return SkipString();
                if (c == '(' || c == '[' || c == '{') return SkipGroup();

                if (ReadIdentifier())
                    return !Peek('(') || SkipGroup();

                const size_t start = m_Pos;
                while (m_Pos < m_Text.size() && IsLiteralChar(m_Text[m_Pos]))
                    ++m_Pos;
                return m_Pos != start;
            }

            [[nodiscard]] size_t Position() const { return m_Pos; }

        private:
            std::string_view m_Text;
            size_t m_Pos = 0;

            [[nodiscard]] static bool IsLiteralChar(char c)
            {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' || c == '_';
            }

            bool SkipString()
            {
                ++m_Pos; // opening quote
                while (m_Pos < m_Text.size())
                {
                    const char c = m_Text[m_Pos++];
                    if (c == '\\') ++m_Pos;
                    else if (c == '"') return true;
                }
                return false;
            }

            // Balanced (), [] and {}; brackets inside strings do not count.
            bool SkipGroup()
            {
                int depth = 0;
                while (SkipTrivia() && m_Pos < m_Text.size())
                {
                    const char c = m_Text[m_Pos];
                    if (c == '"')
                    {
                        if (!SkipString()) return false;
                        continue;
                    }

                    ++m_Pos;
                    if (c == '(' || c == '[' || c == '{')
                    {
                        ++depth;
                    }
                    else if (c == ')' || c == ']' || c == '}')
                    {
                        if (--depth == 0) return true;
                    }
                }
                return false;
            }

            // False only for an unterminated block comment.
            bool SkipTrivia()
            {
                while (m_Pos < m_Text.size())
                {
                    const char c = m_Text[m_Pos];
                    if (std::isspace(static_cast<unsigned char>(c)))
                    {
                        ++m_Pos;
                    }
                    else if (m_Text.substr(m_Pos, 2) == "//")
                    {
                        const size_t eol = m_Text.find('\n', m_Pos);
                        m_Pos = (eol == std::string_view::npos) ? m_Text.size() : eol + 1;
                    }
                    else if (m_Text.substr(m_Pos, 2) == "/*")
                    {
                        const size_t close = m_Text.find("*/", m_Pos + 2);
                        if (close == std::string_view::npos) return false;
                        m_Pos = close + 2;
                    }
                    else
                    {
                        break;
                    }
                }
                return true;
            }
        };

        [[nodiscard]] bool IsPaddingField(std::string_view name)
        {
            for (auto field : kPaddingFields)
                if (field == name) return true;
            return false;
        }
    }

    std::expected<SlimeParams, AssetError> DecodeSlime(std::string_view text)
    {
        SlimeReader reader(text);
        auto fail = [&reader](std::string_view what) -> std::unexpected<AssetError>
        {
            Core::Log::Debug("DecodeSlime: {} at offset {}", what, reader.Position());
            return std::unexpected(AssetError::DecodeFailed);
        };

        if (!reader.Peek('('))
        {
            auto name = reader.ReadIdentifier();
            if (!name || *name != kStructName) return fail("expected '(' or 'Slime('");
        }
        if (!reader.Expect('(')) return fail("expected '('");

        SlimeParams params{};
        bool hasValue = false;
        bool seenPadding[3] = {false, false, false};

        while (!reader.Peek(')'))
        {
            auto field = reader.ReadIdentifier();
            if (!field) return fail("expected field name");
            if (!reader.Expect(':')) return fail("expected ':'");

            if (*field == kValueField)
            {
                auto number = reader.ReadFloat();
                if (!number) return fail("expected finite number");
                if (hasValue) return fail("duplicate field 'value'");
                params.Value = *number;
                hasValue = true;
            }
            else if (IsPaddingField(*field))
            {
                auto number = reader.ReadFloat();
                if (!number) return fail("expected finite number");
                const size_t index = static_cast<size_t>(field->back() - '0');
                if (seenPadding[index]) return fail("duplicate padding field");
                seenPadding[index] = true;
            }
            else
            {
                // Fields from newer writers are skipped, whatever their value.
                if (!reader.SkipValue()) return fail("malformed value");
                Core::Log::Debug("DecodeSlime: ignoring unknown field '{}'", *field);
            }

            if (!reader.Expect(','))
            {
                if (!reader.Peek(')')) return fail("expected ',' or ')'");
            }
        }

        if (!reader.Expect(')')) return fail("expected ')'");
        if (!reader.AtEnd()) return fail("trailing characters");
        if (!hasValue) return fail("missing field 'value'");

        return params;
    }

    std::span<const std::string_view> SlimeLoader::Extensions() const
    {
        return s_Extensions;
    }

    std::expected<ImportResult, AssetError> SlimeLoader::Load(
        std::span<const std::byte> data,
        const LoadContext& ctx)
    {
        std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());

        auto params = DecodeSlime(text);
        if (!params)
        {
            Core::Log::Error("SlimeLoader: failed to decode '{}'", ctx.SourcePath);
            return std::unexpected(params.error());
        }
        return ImportResult{*params};
    }
}

#include "unit_splitter.hpp"

#include <cctype>
#include <string>

namespace sceneasm::frontend
{
    namespace
    {
        bool isWordCharacter(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
        }

        struct LineHead
        {
            std::string_view word;
            bool isLabel{false};
        };

        LineHead readLineHead(std::string_view line)
        {
            std::size_t index = 0;
            while (index < line.size() && (line[index] == ' ' || line[index] == '\t'))
            {
                ++index;
            }

            const std::size_t start = index;
            while (index < line.size() && isWordCharacter(line[index]))
            {
                ++index;
            }

            LineHead head;
            head.word = line.substr(start, index - start);
            if (head.word.empty() || std::isdigit(static_cast<unsigned char>(head.word.front())))
            {
                head.word = {};
                return head;
            }

            while (index < line.size() && (line[index] == ' ' || line[index] == '\t'))
            {
                ++index;
            }
            head.isLabel = index < line.size() && line[index] == ':';
            return head;
        }

        class LineScanner
        {
        public:
            // Updates the comment state across one physical line. Returns true when the
            // line ends in a continuation outside of comments and strings.
            bool scan(std::string_view line)
            {
                bool inString = false;
                for (std::size_t index = 0; index < line.size(); ++index)
                {
                    const char ch = line[index];
                    const char next = index + 1 < line.size() ? line[index + 1] : '\0';

                    if (m_blockDepth > 0)
                    {
                        if (ch == '/' && next == '*')
                        {
                            ++m_blockDepth;
                            ++index;
                        }
                        else if (ch == '*' && next == '/')
                        {
                            --m_blockDepth;
                            ++index;
                        }
                        continue;
                    }

                    if (inString)
                    {
                        if (ch == '\\' && (next == '\\' || next == '"'))
                        {
                            ++index;
                        }
                        else if (ch == '"')
                        {
                            inString = false;
                        }
                        continue;
                    }

                    if (ch == '"')
                    {
                        inString = true;
                    }
                    else if (ch == '/' && next == '/')
                    {
                        return false;
                    }
                    else if (ch == '/' && next == '*')
                    {
                        ++m_blockDepth;
                        ++index;
                    }
                    else if (ch == '\\')
                    {
                        const std::string_view rest = line.substr(index + 1);
                        if (rest.empty() || rest == "\r")
                        {
                            return true;
                        }
                    }
                }
                return false;
            }

            [[nodiscard]] bool inBlockComment() const noexcept
            {
                return m_blockDepth > 0;
            }

        private:
            std::size_t m_blockDepth{0};
        };
    } // namespace

    std::vector<SourceSegment> splitUnits(std::string_view source)
    {
        std::vector<SourceSegment> segments;
        SourceLocation segmentOrigin{};
        std::size_t segmentStart = 0;

        LineScanner scanner;
        std::string_view openTerminator;
        bool logicalLineStart = true;
        std::size_t offset = 0;
        std::uint32_t line = 1;

        while (offset < source.size())
        {
            std::size_t lineEnd = source.find('\n', offset);
            const std::size_t nextOffset = lineEnd == std::string_view::npos ? source.size() : lineEnd + 1;
            if (lineEnd == std::string_view::npos)
            {
                lineEnd = source.size();
            }
            const std::string_view text = source.substr(offset, lineEnd - offset);

            if (logicalLineStart && !scanner.inBlockComment())
            {
                const LineHead head = readLineHead(text);
                if (openTerminator.empty())
                {
                    const bool startsItem = head.word == "function" || head.word == "subroutine" || head.word == "def"
                        || (!head.word.empty() && head.isLabel);
                    if (startsItem && offset > segmentStart)
                    {
                        segments.push_back({source.substr(segmentStart, offset - segmentStart), segmentOrigin});
                        segmentStart = offset;
                        segmentOrigin = {line, 1, static_cast<std::uint32_t>(offset)};
                    }

                    if (head.word == "function")
                    {
                        openTerminator = "endfun";
                    }
                    else if (head.word == "subroutine")
                    {
                        openTerminator = "endsub";
                    }
                }
                else if (head.word == openTerminator)
                {
                    openTerminator = {};
                }
            }

            logicalLineStart = !scanner.scan(text);
            offset = nextOffset;
            ++line;
        }

        if (segmentStart < source.size() || segments.empty())
        {
            segments.push_back({source.substr(segmentStart), segmentOrigin});
        }
        return segments;
    }
} // namespace sceneasm::frontend

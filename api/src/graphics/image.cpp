#include "pt_api/graphics/image.hpp"
#include "pt_api/core/filesystem.hpp"
#include "pt_api/core/debug.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace pt_api {

    namespace {
        // Leitor de tokens do cabeçalho PPM (ignora espaços e comentários '#')
        class PPMReader {
        public:
            explicit PPMReader(const std::vector<uint8_t>& bytes) : m_bytes(bytes) {}

            std::string NextToken() {
                skipWhitespaceAndComments();
                const size_t begin = m_pos;
                while (m_pos < m_bytes.size() && !std::isspace(m_bytes[m_pos]) && m_bytes[m_pos] != '#')
                    ++m_pos;
                return std::string(m_bytes.begin() + begin, m_bytes.begin() + m_pos);
            }

            int NextInt() {
                const std::string token = NextToken();
                int value = 0;
                const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
                if (token.empty() || ec != std::errc() || ptr != token.data() + token.size())
                    PT_LOG_THROW("Invalid PPM integer '{}'", token);
                return value;
            }

            // Exactly one whitespace byte separates the header from binary data
            void SkipSingleWhitespace() {
                if (m_pos < m_bytes.size() && std::isspace(m_bytes[m_pos]))
                    ++m_pos;
            }

            size_t Position() const { return m_pos; }
            size_t Remaining() const { return m_bytes.size() - m_pos; }

        private:
            void skipWhitespaceAndComments() {
                while (m_pos < m_bytes.size()) {
                    if (std::isspace(m_bytes[m_pos])) {
                        ++m_pos;
                    } else if (m_bytes[m_pos] == '#') {
                        while (m_pos < m_bytes.size() && m_bytes[m_pos] != '\n')
                            ++m_pos;
                    } else {
                        break;
                    }
                }
            }

            const std::vector<uint8_t>& m_bytes;
            size_t m_pos = 0;
        };
    }

    // --- Image --- //

    Image::Image(int width, int height, std::vector<uint8_t> rgb)
        : m_width(width), m_height(height), m_data(std::move(rgb))
    {
        if (width < 0 || height < 0 || m_data.size() != static_cast<size_t>(width) * height * 3)
            throw std::invalid_argument("Image data does not match its dimensions");
    }

    Image Image::LoadPPM(const std::filesystem::path& path)
    {
        const std::vector<uint8_t> bytes = filesystem::ReadBytes(path);
        Image image = DecodePPM(bytes);
        PT_LOG_DEBUG("Loaded image {} ({}x{})", path.string(), image.m_width, image.m_height);
        return image;
    }

    Image Image::DecodePPM(const std::vector<uint8_t>& bytes)
    {
        PPMReader reader(bytes);

        const std::string magic = reader.NextToken();
        if (magic != "P3" && magic != "P6")
            PT_LOG_THROW("Unsupported PPM format '{}' (expected P3 or P6)", magic);

        const int width = reader.NextInt();
        const int height = reader.NextInt();
        const int maxval = reader.NextInt();
        if (width <= 0 || height <= 0 || maxval != 255)
            PT_LOG_THROW("Invalid PPM header ({}x{}, maxval {})", width, height, maxval);

        const size_t byteCount = static_cast<size_t>(width) * height * 3;
        std::vector<uint8_t> data(byteCount);

        if (magic == "P6") {
            reader.SkipSingleWhitespace();
            if (reader.Remaining() < byteCount)
                PT_LOG_THROW("Truncated PPM data: expected {} bytes, found {}", byteCount, reader.Remaining());
            std::copy_n(bytes.begin() + reader.Position(), byteCount, data.begin());
        } else {
            for (size_t i = 0; i < byteCount; ++i) {
                const int value = reader.NextInt();
                if (value < 0 || value > 255)
                    PT_LOG_THROW("PPM sample {} out of range", value);
                data[i] = static_cast<uint8_t>(value);
            }
        }

        return Image(width, height, std::move(data));
    }

    const uint8_t* Image::PixelData(int x, int y) const
    {
        static const uint8_t magenta[] = { 255, 0, 255 };
        if (m_data.empty())
            return magenta;

        x = std::clamp(x, 0, m_width - 1);
        y = std::clamp(y, 0, m_height - 1);
        return m_data.data() + (static_cast<size_t>(y) * m_width + x) * 3;
    }

    // --- Framebuffer --- //

    Framebuffer::Framebuffer(int width, int height)
        : m_width(width), m_height(height), m_pixels(static_cast<size_t>(width) * height, Color(0.0))
    {
    }

    uint8_t Framebuffer::ToByte(double linear)
    {
        const double gamma = LinearToGamma(linear);
        return static_cast<uint8_t>(256.0 * std::clamp(gamma, 0.0, 0.999));
    }

    std::vector<uint8_t> Framebuffer::ToRGB8() const
    {
        std::vector<uint8_t> out;
        out.reserve(m_pixels.size() * 3);
        for (const Color& c : m_pixels) {
            out.push_back(ToByte(c.r));
            out.push_back(ToByte(c.g));
            out.push_back(ToByte(c.b));
        }
        return out;
    }

    void Framebuffer::WritePPM(const std::filesystem::path& path) const
    {
        const std::string header = fmt::format("P6\n{} {}\n255\n", m_width, m_height);
        const std::vector<uint8_t> rgb = ToRGB8();

        filesystem::WriteBytes(path, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(header.data()), header.size()));
        filesystem::WriteBytes(path, rgb, true);

        PT_LOG_INFO("Wrote {} ({}x{})", path.string(), m_width, m_height);
    }
}

#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <filesystem>
#include "pt_api/core/math.hpp"

namespace pt_api {

    /**
     * @brief Imagem RGB de 8 bits, linhas de cima para baixo.
     */
    class Image {
    public:
        Image() = default;
        Image(int width, int height, std::vector<uint8_t> rgb);

        /**
         * @brief Decodifica um arquivo PPM binário (P6) ou ASCII (P3).
         * @throws std::runtime_error se o arquivo não puder ser lido ou não for um PPM de 8 bits válido.
         */
        static Image LoadPPM(const std::filesystem::path& path);

        /// Igual a LoadPPM, a partir de bytes em memória.
        static Image DecodePPM(const std::vector<uint8_t>& bytes);

        int GetWidth() const noexcept { return m_width; }
        int GetHeight() const noexcept { return m_height; }
        bool Empty() const noexcept { return m_data.empty(); }
        const std::vector<uint8_t>& GetData() const noexcept { return m_data; }

        /// Ponteiro para os 3 bytes do pixel (x, y); coordenadas limitadas à imagem.
        const uint8_t* PixelData(int x, int y) const;

    private:
        int m_width = 0;
        int m_height = 0;
        std::vector<uint8_t> m_data;
    };

    /**
     * @brief Destino da renderização em espaço linear, por linhas, uma Color por pixel.
     */
    class Framebuffer {
    public:
        Framebuffer() = default;
        Framebuffer(int width, int height);

        int GetWidth() const noexcept { return m_width; }
        int GetHeight() const noexcept { return m_height; }

        Color& At(int x, int y) { return m_pixels[static_cast<size_t>(y) * m_width + x]; }
        const Color& At(int x, int y) const { return m_pixels[static_cast<size_t>(y) * m_width + x]; }

        const std::vector<Color>& GetPixels() const noexcept { return m_pixels; }

        // --- Encoding --- //
        static double LinearToGamma(double linear) { return linear > 0.0 ? std::sqrt(linear) : 0.0; }
        static uint8_t ToByte(double linear);

        /// RGB de 8 bits com gamma, mesmo layout do framebuffer.
        std::vector<uint8_t> ToRGB8() const;

        /// Grava um PPM binário (P6). Lança std::runtime_error em falha de I/O.
        void WritePPM(const std::filesystem::path& path) const;

    private:
        int m_width = 0;
        int m_height = 0;
        std::vector<Color> m_pixels;
    };
}

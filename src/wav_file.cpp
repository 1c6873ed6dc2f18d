#include "wav_file.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace {

constexpr std::uint16_t kFormatPcm = 1;
constexpr std::uint16_t kFormatFloat = 3;
constexpr std::uint16_t kFormatExtensible = 0xFFFE;

std::uint16_t le16(const unsigned char* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t le32(const unsigned char* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

void put16(std::ofstream& out, std::uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>(v >> 8)};
    out.write(b, 2);
}

void put32(std::ofstream& out, std::uint32_t v) {
    const char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                       static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
    out.write(b, 4);
}

// Bytes between the read position and the end of the file.
std::size_t bytes_left(std::ifstream& in) {
    const std::streampos here = in.tellg();
    in.seekg(0, std::ios::end);
    const std::streamoff left = in.tellg() - here;
    in.seekg(here);
    return left > 0 ? static_cast<std::size_t>(left) : 0;
}

float decode_sample(const unsigned char* p, std::uint16_t format, int bits) {
    if (format == kFormatFloat) {
        float f;
        std::memcpy(&f, p, sizeof(f));
        return f;
    }
    switch (bits) {
        case 16: return static_cast<std::int16_t>(le16(p)) / 32768.0f;
        case 24: {
            std::int32_t v = static_cast<std::int32_t>(p[0] | (p[1] << 8) | (p[2] << 16));
            if (v & 0x800000) v -= 0x1000000;
            return static_cast<float>(v / 8388608.0);
        }
        case 32: return static_cast<float>(static_cast<std::int32_t>(le32(p)) / 2147483648.0);
    }
    return 0.0f;
}

} // namespace

WavAudio read_wav_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open WAV file: " + path);
    }

    unsigned char riff[12];
    if (!in.read(reinterpret_cast<char*>(riff), sizeof(riff)) ||
        std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        throw std::runtime_error("Not a RIFF/WAVE file: " + path);
    }

    std::uint16_t format = 0;
    std::uint16_t channels = 0;
    std::uint32_t sample_rate = 0;
    std::uint16_t block_align = 0;
    std::uint16_t bits = 0;
    bool have_fmt = false;

    unsigned char hdr[8];
    while (in.read(reinterpret_cast<char*>(hdr), sizeof(hdr))) {
        const std::uint32_t size = le32(hdr + 4);
        if (std::memcmp(hdr, "fmt ", 4) == 0) {
            if (size < 16 || size > bytes_left(in)) {
                throw std::runtime_error("Truncated fmt chunk in " + path);
            }
            std::vector<unsigned char> fmt(size);
            if (!in.read(reinterpret_cast<char*>(fmt.data()), size)) {
                throw std::runtime_error("Truncated fmt chunk in " + path);
            }
            format = le16(&fmt[0]);
            channels = le16(&fmt[2]);
            sample_rate = le32(&fmt[4]);
            block_align = le16(&fmt[12]);
            bits = le16(&fmt[14]);
            if (format == kFormatExtensible && size >= 26) {
                format = le16(&fmt[24]); // sub-format GUID starts with the format tag
            }
            have_fmt = true;
        } else if (std::memcmp(hdr, "data", 4) == 0) {
            if (!have_fmt) throw std::runtime_error("data chunk before fmt chunk in " + path);
            if (format != kFormatPcm && format != kFormatFloat) {
                throw std::runtime_error("Unsupported WAV format tag " + std::to_string(format) + " in " + path);
            }
            if (format == kFormatFloat && bits != 32) {
                throw std::runtime_error("Only 32-bit float WAV is supported: " + path);
            }
            if (format == kFormatPcm && bits != 16 && bits != 24 && bits != 32) {
                throw std::runtime_error("Unsupported PCM bit depth " + std::to_string(bits) + " in " + path);
            }
            if (channels == 0 || sample_rate == 0 || block_align != channels * (bits / 8)) {
                throw std::runtime_error("Inconsistent fmt chunk in " + path);
            }

            // Streamed writers leave the size at 0xFFFFFFFF and truncated files
            // fall short of it; read no further than the end of the file.
            const std::size_t want = std::min<std::size_t>(size, bytes_left(in));

            std::vector<unsigned char> data(want);
            in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(want));
            const std::size_t got = static_cast<std::size_t>(in.gcount());

            WavAudio wav;
            wav.sample_rate = static_cast<int>(sample_rate);
            wav.channels = channels;
            wav.bits_per_sample = bits;

            const std::size_t frames = got / block_align;
            const std::size_t width = bits / 8;
            wav.samples.resize(frames);
            for (std::size_t i = 0; i < frames; ++i) {
                const unsigned char* frame = data.data() + i * block_align;
                double acc = 0.0;
                for (std::size_t c = 0; c < channels; ++c) {
                    acc += decode_sample(frame + c * width, format, bits);
                }
                wav.samples[i] = static_cast<float>(acc / channels);
            }
            return wav;
        } else {
            in.seekg(size + (size & 1), std::ios::cur); // chunks are word aligned
        }
    }
    throw std::runtime_error("No data chunk in " + path);
}

void write_wav_file(const std::string& path, const std::vector<float>& samples, int sample_rate) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create WAV file: " + path);
    }
    const auto data_size = static_cast<std::uint32_t>(samples.size() * 2);
    out.write("RIFF", 4);
    put32(out, 36 + data_size);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put32(out, 16);
    put16(out, kFormatPcm);
    put16(out, 1);
    put32(out, static_cast<std::uint32_t>(sample_rate));
    put32(out, static_cast<std::uint32_t>(sample_rate) * 2);
    put16(out, 2);
    put16(out, 16);
    out.write("data", 4);
    put32(out, data_size);
    for (float s : samples) {
        const float c = std::clamp(s, -1.0f, 1.0f);
        put16(out, static_cast<std::uint16_t>(static_cast<std::int16_t>(c * 32767.0f)));
    }
    if (!out) {
        throw std::runtime_error("Failed writing WAV file: " + path);
    }
}

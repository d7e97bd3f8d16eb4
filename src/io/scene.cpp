#include "scene.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

namespace io {

namespace {

// Pull reader over a scene document. Values are consumed in place; keys the
// scene does not know are skipped whole. Errors throw std::runtime_error
// carrying the byte offset.
class SceneReader {
public:
    explicit SceneReader(std::string text) : text_(std::move(text)) {}

    void read(Scene& sc) {
        for_each_member([&](const std::string& key) { read_member(sc, key); });
        ws();
        if (pos_ != text_.size()) fail("trailing characters");
    }

private:
    std::string text_;
    size_t pos_{0};

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(what + " at offset " + std::to_string(pos_));
    }

    void ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    char peek() {
        ws();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    bool accept(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void require(char c) {
        if (!accept(c)) fail(std::string("expected '") + c + "'");
    }

    bool keyword(const char* word) {
        const size_t n = std::strlen(word);
        if (text_.compare(pos_, n, word) != 0) return false;
        pos_ += n;
        return true;
    }

    template <typename OnKey>
    void for_each_member(OnKey onKey) {
        require('{');
        if (accept('}')) return;
        do {
            if (peek() != '"') fail("member name expected");
            const std::string key = string_value();
            require(':');
            onKey(key);
        } while (accept(','));
        require('}');
    }

    template <typename OnItem>
    void for_each_item(OnItem onItem) {
        require('[');
        if (accept(']')) return;
        do {
            onItem();
        } while (accept(','));
        require(']');
    }

    std::string string_value() {
        require('"');
        std::string out;
        for (;;) {
            if (pos_ >= text_.size()) fail("unterminated string");
            const char c = text_[pos_++];
            if (c == '"') return out;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) fail("unterminated string");
            const char e = text_[pos_++];
            switch (e) {
                case '"': case '\\': case '/': out.push_back(e); break;
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                default: fail("unsupported escape");
            }
        }
    }

    void digits() {
        const size_t start = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        if (pos_ == start) fail("digit expected");
    }

    double number_value() {
        ws();
        const size_t start = pos_;
        if (text_[pos_] == '-') ++pos_;
        digits();
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            digits();
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            digits();
        }
        return std::stod(text_.substr(start, pos_ - start));
    }

    bool at_number() {
        const char c = peek();
        return c == '-' || std::isdigit(static_cast<unsigned char>(c));
    }

    void skip_value() {
        const char c = peek();
        if (c == '{') {
            for_each_member([&](const std::string&) { skip_value(); });
        } else if (c == '[') {
            for_each_item([&] { skip_value(); });
        } else if (c == '"') {
            string_value();
        } else if (at_number()) {
            number_value();
        } else if (!keyword("true") && !keyword("false") && !keyword("null")) {
            fail("invalid value");
        }
    }

    // Typed reads: a value of another JSON type is skipped and the target
    // keeps its current value.
    void read(double& out) {
        if (at_number()) out = number_value();
        else skip_value();
    }

    // Integers are rounded; values outside the target type are an error
    // rather than a silent wrap.
    template <typename Int>
    Int integer_value() {
        const size_t start = pos_;
        const double v = std::round(number_value());
        // Two's complement range [min, -min), both bounds exact in a double.
        const double lo = static_cast<double>(std::numeric_limits<Int>::min());
        if (v < lo || v >= -lo) {
            pos_ = start;
            fail("integer out of range");
        }
        return static_cast<Int>(v);
    }

    void read(int& out) {
        if (at_number()) out = integer_value<int>();
        else skip_value();
    }

    void read(long long& out) {
        if (at_number()) out = integer_value<long long>();
        else skip_value();
    }

    void read(bool& out) {
        peek();
        if (keyword("true")) out = true;
        else if (keyword("false")) out = false;
        else skip_value();
    }

    void read(std::string& out) {
        if (peek() == '"') out = string_value();
        else skip_value();
    }

    void read_vortex(std::vector<SceneVortex>& out) {
        if (peek() != '{') {
            skip_value();
            return;
        }
        SceneVortex v{0.0, 0.0, 1};
        for_each_member([&](const std::string& key) {
            if (key == "cx") read(v.cx);
            else if (key == "cy") read(v.cy);
            else if (key == "winding") read(v.winding);
            else skip_value();
        });
        // A zero-charge entry imprints nothing.
        if (v.winding != 0) out.push_back(v);
    }

    void read_member(Scene& sc, const std::string& key) {
        if (key == "Nx") read(sc.Nx);
        else if (key == "Ny") read(sc.Ny);
        else if (key == "diffusion") read(sc.diffusion);
        else if (key == "dt") read(sc.dt);
        else if (key == "noise_level") read(sc.noise_level);
        else if (key == "steps_per_frame") read(sc.steps_per_frame);
        else if (key == "smooth_rendering") read(sc.smooth_rendering);
        else if (key == "seed") read(sc.seed);
        else if (key == "initial_state") read(sc.initial_state);
        else if (key == "steps") read(sc.steps);
        else if (key == "vortices" && peek() == '[') {
            sc.vortices.clear();
            for_each_item([&] { read_vortex(sc.vortices); });
        } else skip_value();
    }
};

} // namespace

bool save_scene(const std::string& path, const Scene& s) {
    std::ofstream out(path);
    if (!out) return false;
    out << std::setprecision(17) << std::boolalpha;
    out << "{\n"
        << "  \"Nx\": " << s.Nx << ",\n"
        << "  \"Ny\": " << s.Ny << ",\n"
        << "  \"diffusion\": " << s.diffusion << ",\n"
        << "  \"dt\": " << s.dt << ",\n"
        << "  \"noise_level\": " << s.noise_level << ",\n"
        << "  \"steps_per_frame\": " << s.steps_per_frame << ",\n"
        << "  \"smooth_rendering\": " << s.smooth_rendering << ",\n"
        << "  \"seed\": " << s.seed << ",\n"
        << "  \"initial_state\": \"" << s.initial_state << "\",\n"
        << "  \"steps\": " << s.steps << ",\n"
        << "  \"vortices\": [";
    const char* sep = "\n";
    for (const SceneVortex& v : s.vortices) {
        out << sep << "    {\"cx\": " << v.cx << ", \"cy\": " << v.cy << ", \"winding\": " << v.winding << "}";
        sep = ",\n";
    }
    out << (s.vortices.empty() ? "]\n" : "\n  ]\n") << "}\n";
    return static_cast<bool>(out);
}

bool load_scene(const std::string& path, Scene& sc) {
    std::ifstream in(path);
    if (!in) return false;
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    Scene parsed = sc;
    try {
        SceneReader(std::move(text)).read(parsed);
        sim::Field::check_size(parsed.Nx, parsed.Ny);
    } catch (const std::exception& e) {
        std::cerr << "Scene " << path << ": " << e.what() << "\n";
        return false;
    }
    sc = std::move(parsed);
    return true;
}

void from_simulation(const sim::Simulation& src, Scene& s) {
    s.Nx = src.Nx;
    s.Ny = src.Ny;
    s.diffusion = src.params.diffusion;
    s.dt = src.params.dt;
    s.noise_level = src.params.noiseLevel;
    s.steps_per_frame = src.params.stepsPerFrame;
    // Live vortices are part of the field, not separate objects.
    s.vortices.clear();
}

void to_simulation(const Scene& s, sim::Simulation& dst) {
    // Throws before anything in dst changes.
    sim::Field::check_size(s.Nx, s.Ny);
    if (s.seed >= 0) dst.reseed_rng(static_cast<std::uint64_t>(s.seed));
    dst.resize(s.Nx, s.Ny);
    dst.params.diffusion = s.diffusion;
    dst.params.dt = s.dt;
    dst.params.noiseLevel = std::max(0.0, s.noise_level);
    dst.params.stepsPerFrame = std::max(1, s.steps_per_frame);
    if (s.initial_state == "ordered") dst.field.fill(1.0, 0.0);
    for (const SceneVortex& v : s.vortices) dst.imprint(v.cx, v.cy, v.winding);
}

int run_example_cli(const std::string& scene_path) {
    Scene scene;
    if (!scene_path.empty() && !load_scene(scene_path, scene)) {
        std::cerr << "Cannot load scene: " << scene_path << "\n";
        return 2;
    }
    sim::Simulation simulation;
    to_simulation(scene, simulation);

    int pos0 = 0, neg0 = 0;
    simulation.count_defects(pos0, neg0);
    simulation.stepN(scene.steps);
    int pos = 0, neg = 0;
    simulation.count_defects(pos, neg);

    const sim::Params& p = simulation.params;
    const double bound = simulation.stability_bound();
    std::cout << "Scene " << (scene_path.empty() ? "<defaults>" : scene_path) << "\n"
              << "  grid " << simulation.Nx << "x" << simulation.Ny << "  D=" << p.diffusion
              << "  dt=" << p.dt << "  noise=" << p.noiseLevel << "  steps=" << simulation.stepCount << "\n"
              << std::setprecision(8)
              << "  mean|psi|=" << simulation.mean_magnitude() << "\n"
              << "  vortices +" << pos0 << "/-" << neg0 << " -> +" << pos << "/-" << neg << "\n"
              << "  4*D*dt=" << bound << "\n";

    if (!simulation.all_finite()) {
        std::cout << "  stability: DIVERGED (non-finite field values)\n";
        return 3;
    }
    std::cout << (bound >= 1.0 ? "  stability: WARNING (4*D*dt >= 1)\n" : "  stability: OK\n");
    return 0;
}

} // namespace io

#include <tofu/LayoutDescriptor.hpp>
#include <tofu/Logger.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <algorithm>
#include <cctype>
#include <format>

namespace tofu {

namespace {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

/// Read an optional numeric knob. Non-numeric values are ignored with a warning.
std::optional<float> read_knob(const rapidjson::Value& params, const char* name) {
    if (!params.HasMember(name)) {
        return std::nullopt;
    }
    const auto& value = params[name];
    if (!value.IsNumber()) {
        Logger::instance().warn("Layout param '{}' is not a number, using default", name);
        return std::nullopt;
    }
    return static_cast<float>(value.GetDouble());
}

LayoutParams read_params(LayoutKind kind, std::string_view type_name, const rapidjson::Value* params) {
    static const rapidjson::Value empty_object(rapidjson::kObjectType);
    const rapidjson::Value& p = (params && params->IsObject()) ? *params : empty_object;

    switch (kind) {
        case LayoutKind::Circle:
            return CircleParams{.radius_factor = read_knob(p, "radius_factor")};
        case LayoutKind::Grid:
            return GridParams{.padding = read_knob(p, "padding")};
        case LayoutKind::Helix:
            return HelixParams{
                .amplitude = read_knob(p, "amplitude"),
                .frequency = read_knob(p, "frequency")
            };
        case LayoutKind::Spiral:
            return SpiralParams{
                .max_radius_factor = read_knob(p, "max_radius_factor"),
                .rotations = read_knob(p, "rotations")
            };
        case LayoutKind::Wave:
            return WaveParams{
                .amplitude = read_knob(p, "amplitude"),
                .frequency = read_knob(p, "frequency")
            };
        case LayoutKind::Random:
            return RandomParams{.padding = read_knob(p, "padding")};
        case LayoutKind::Custom:
            return CustomParams{};
        case LayoutKind::Unknown:
            break;
    }
    return UnknownParams{.type_name = std::string(type_name)};
}

std::vector<glm::vec2> read_coordinates(const rapidjson::Value& array) {
    std::vector<glm::vec2> coordinates;
    coordinates.reserve(array.Size());

    for (rapidjson::SizeType i = 0; i < array.Size(); ++i) {
        const auto& entry = array[i];
        if (!entry.IsArray() || entry.Size() < 2 || !entry[0].IsNumber() || !entry[1].IsNumber()) {
            Logger::instance().warn("Skipping malformed coordinate at index {}", i);
            continue;
        }
        coordinates.emplace_back(static_cast<float>(entry[0].GetDouble()),
                                 static_cast<float>(entry[1].GetDouble()));
    }
    return coordinates;
}

LayoutKind kind_of(const CircleParams&) { return LayoutKind::Circle; }
LayoutKind kind_of(const GridParams&) { return LayoutKind::Grid; }
LayoutKind kind_of(const HelixParams&) { return LayoutKind::Helix; }
LayoutKind kind_of(const SpiralParams&) { return LayoutKind::Spiral; }
LayoutKind kind_of(const WaveParams&) { return LayoutKind::Wave; }
LayoutKind kind_of(const RandomParams&) { return LayoutKind::Random; }
LayoutKind kind_of(const CustomParams&) { return LayoutKind::Custom; }
LayoutKind kind_of(const UnknownParams&) { return LayoutKind::Unknown; }

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_knob(JsonWriter& writer, const char* name, const std::optional<float>& value) {
    if (value) {
        writer.Key(name);
        writer.Double(*value);
    }
}

void write_params(JsonWriter& writer, const CircleParams& p) {
    write_knob(writer, "radius_factor", p.radius_factor);
}
void write_params(JsonWriter& writer, const GridParams& p) {
    write_knob(writer, "padding", p.padding);
}
void write_params(JsonWriter& writer, const HelixParams& p) {
    write_knob(writer, "amplitude", p.amplitude);
    write_knob(writer, "frequency", p.frequency);
}
void write_params(JsonWriter& writer, const SpiralParams& p) {
    write_knob(writer, "max_radius_factor", p.max_radius_factor);
    write_knob(writer, "rotations", p.rotations);
}
void write_params(JsonWriter& writer, const WaveParams& p) {
    write_knob(writer, "amplitude", p.amplitude);
    write_knob(writer, "frequency", p.frequency);
}
void write_params(JsonWriter& writer, const RandomParams& p) {
    write_knob(writer, "padding", p.padding);
}
void write_params(JsonWriter&, const CustomParams&) {}
void write_params(JsonWriter&, const UnknownParams&) {}

} // anonymous namespace

LayoutKind parse_layout_kind(std::string_view type) {
    auto lowered = to_lower(type);
    if (lowered == "circle") return LayoutKind::Circle;
    if (lowered == "grid") return LayoutKind::Grid;
    if (lowered == "helix" || lowered == "dna_helix") return LayoutKind::Helix;
    if (lowered == "spiral") return LayoutKind::Spiral;
    if (lowered == "wave") return LayoutKind::Wave;
    if (lowered == "random") return LayoutKind::Random;
    if (lowered == "custom") return LayoutKind::Custom;
    return LayoutKind::Unknown;
}

std::string_view to_string(LayoutKind kind) {
    switch (kind) {
        case LayoutKind::Circle: return "circle";
        case LayoutKind::Grid: return "grid";
        case LayoutKind::Helix: return "helix";
        case LayoutKind::Spiral: return "spiral";
        case LayoutKind::Wave: return "wave";
        case LayoutKind::Random: return "random";
        case LayoutKind::Custom: return "custom";
        case LayoutKind::Unknown: break;
    }
    return "unknown";
}

LayoutKind LayoutDescriptor::kind() const {
    return std::visit([](const auto& p) { return kind_of(p); }, params);
}

LayoutDescriptor LayoutDescriptor::of_kind(LayoutKind kind) {
    LayoutDescriptor descriptor;
    descriptor.params = read_params(kind, to_string(kind), nullptr);
    return descriptor;
}

LayoutDescriptor LayoutDescriptor::custom(std::vector<glm::vec2> coordinates) {
    LayoutDescriptor descriptor;
    descriptor.params = CustomParams{};
    descriptor.coordinates = std::move(coordinates);
    return descriptor;
}

std::expected<LayoutDescriptor, std::string> parse_layout_descriptor(std::string_view json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError()) {
        return std::unexpected(std::format("Invalid layout JSON at offset {}: {}",
            document.GetErrorOffset(), rapidjson::GetParseError_En(document.GetParseError())));
    }
    if (!document.IsObject()) {
        return std::unexpected("Layout JSON must contain an object at the root");
    }

    LayoutDescriptor descriptor;
    descriptor.version.clear();
    if (document.HasMember("version") && document["version"].IsString()) {
        descriptor.version = document["version"].GetString();
    }

    if (!document.HasMember("layout") || !document["layout"].IsObject()) {
        Logger::instance().warn("Layout JSON has no 'layout' object");
        descriptor.params = UnknownParams{};
        return descriptor;
    }
    const auto& layout = document["layout"];

    std::string type_name;
    if (layout.HasMember("type") && layout["type"].IsString()) {
        type_name = layout["type"].GetString();
    } else {
        Logger::instance().warn("Layout JSON has no string 'type'");
    }

    const rapidjson::Value* params = layout.HasMember("params") ? &layout["params"] : nullptr;
    descriptor.params = read_params(parse_layout_kind(type_name), type_name, params);

    if (layout.HasMember("coordinates")) {
        const auto& coordinates = layout["coordinates"];
        if (coordinates.IsArray()) {
            descriptor.coordinates = read_coordinates(coordinates);
        } else if (!coordinates.IsNull()) {
            Logger::instance().warn("Layout 'coordinates' is not an array, ignoring it");
        }
    }

    return descriptor;
}

LayoutDescriptor parse_layout_descriptor_or_random(std::string_view json) {
    auto descriptor = parse_layout_descriptor(json);
    if (!descriptor) {
        Logger::instance().warn("{}, using random", descriptor.error());
        return LayoutDescriptor::of_kind(LayoutKind::Random);
    }
    return std::move(*descriptor);
}

std::string to_json(const LayoutDescriptor& descriptor) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("version");
    writer.String(descriptor.version.c_str());
    writer.Key("layout");
    writer.StartObject();

    writer.Key("type");
    if (const auto* unknown = std::get_if<UnknownParams>(&descriptor.params)) {
        writer.String(unknown->type_name.c_str());
    } else {
        auto name = to_string(descriptor.kind());
        writer.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
    }

    writer.Key("params");
    writer.StartObject();
    std::visit([&writer](const auto& p) { write_params(writer, p); }, descriptor.params);
    writer.EndObject();

    if (descriptor.coordinates) {
        writer.Key("coordinates");
        writer.StartArray();
        for (const auto& point : *descriptor.coordinates) {
            writer.StartArray();
            writer.Double(point.x);
            writer.Double(point.y);
            writer.EndArray();
        }
        writer.EndArray();
    }

    writer.EndObject();
    writer.EndObject();
    return buffer.GetString();
}

} // namespace tofu

// NodeCraftGraphJson.cpp
//
// Loads and dumps flow documents:
//
//   {
//     "nodes": [
//       {"id": 1, "name": "A", "operation": "core::value", "inputs": [{"type": "f64", "value": 5}]},
//       {"id": 2, "name": "B", "operation": "math::double", "inputs": [{"node": 1}]},
//       {"id": 3, "network": "scale", "inputs": [{"node": 2}]}
//     ],
//     "export": 3,
//     "definitions": {
//       "scale": {"imports": ["f64"], "export": 2, "nodes": [
//         {"id": 1, "parameter": 0},
//         {"id": 2, "operation": "math::multiply", "inputs": [{"node": 1}, {"value": 2.0}]}
//       ]}
//     }
//   }
//
// Literal values are JSON scalars/arrays or primitive strings ("5_u32",
// "#ff0000ff", "1, 2") interpreted against the input's "type". Colors are
// written as [r, g, b, a] float channels so they load back unchanged.
#include "NodeCraftGraph.hpp"
#include "NodeCraftError.hpp"
#include <fmt/core.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace NodeCraft {

namespace {

using nlohmann::json;

template <typename T>
T unsignedFromJson(const json& value) {
    if (value.is_number_unsigned()) {
        const auto v = value.get<std::uint64_t>();
        if (v <= std::numeric_limits<T>::max()) return static_cast<T>(v);
    } else if (value.is_number_float()) {
        const double d = value.get<double>();
        if (d >= 0.0 && d < std::ldexp(1.0, std::numeric_limits<T>::digits) && std::floor(d) == d) return static_cast<T>(d);
    }
    throw std::runtime_error(fmt::format("Numeric literal out of range for {}: {}", TypeNameOf<T>::name(), value.dump()));
}

Color colorFromJson(const json& value) {
    if (value.is_string()) {
        auto c = TaggedValue::fromPrimitiveString(value.get<std::string>(), Type::concrete(TypeNames::Color));
        if (!c) throw std::runtime_error(fmt::format("Invalid color {}", value.dump()));
        return *c->tryGet<Color>();
    }
    if (!value.is_array() || value.size() != 4) throw std::runtime_error("Color literals need four channels");
    return Color{value[0].get<float>(), value[1].get<float>(), value[2].get<float>(), value[3].get<float>()};
}

json colorToJson(const Color& c) { return json::array({c.r, c.g, c.b, c.a}); }

TaggedValue literalFromJson(const json& value, const Type& declared) {
    const std::string typeName = declared.isConcrete() ? declared.name : std::string();
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (typeName.empty()) return TaggedValue(text);
        if (auto parsed = TaggedValue::fromPrimitiveString(text, declared)) return *parsed;
        throw std::runtime_error(fmt::format("Cannot parse literal '{}' as {}", text, typeName));
    }
    if (value.is_boolean()) return TaggedValue(value.get<bool>());
    if (value.is_null()) return TaggedValue(None{});
    if (value.is_number()) {
        if (typeName == TypeNames::U32) return TaggedValue(unsignedFromJson<std::uint32_t>(value));
        if (typeName == TypeNames::U64) return TaggedValue(unsignedFromJson<std::uint64_t>(value));
        if (!typeName.empty() && typeName != TypeNames::F64)
            throw std::runtime_error(fmt::format("Numeric literal given for input of type {}", typeName));
        return TaggedValue(value.get<double>());
    }
    if (value.is_array()) {
        if (typeName == TypeNames::Color) return TaggedValue(colorFromJson(value));
        if (typeName == TypeNames::Path || (!value.empty() && value.front().is_array())) {
            PathPoints points;
            for (const auto& p : value) {
                if (!p.is_array() || p.size() != 2) throw std::runtime_error("Path points must be [x, y] pairs");
                points.push_back(DVec2{p[0].get<double>(), p[1].get<double>()});
            }
            return TaggedValue(std::move(points));
        }
        if (typeName == TypeNames::Vec2) {
            if (value.size() != 2) throw std::runtime_error("vec2 literals need two components");
            return TaggedValue(DVec2{value[0].get<double>(), value[1].get<double>()});
        }
        F64Array values;
        for (const auto& v : value) values.push_back(v.get<double>());
        return TaggedValue(std::move(values));
    }
    if (value.is_object() && typeName == TypeNames::Raster) {
        Raster r;
        r.width = value.at("width").get<std::uint32_t>();
        r.height = value.at("height").get<std::uint32_t>();
        for (const auto& px : value.at("pixels")) r.pixels.push_back(colorFromJson(px));
        if (r.pixels.size() != static_cast<std::size_t>(r.width) * r.height) throw std::runtime_error("Raster pixel count mismatch");
        return TaggedValue(std::move(r));
    }
    throw std::runtime_error(fmt::format("Unsupported literal {}", value.dump()));
}

json literalToJson(const TaggedValue& value) {
    json out;
    out["type"] = value.type().name;
    if (auto d = value.tryGet<double>()) out["value"] = *d;
    else if (auto b = value.tryGet<bool>()) out["value"] = *b;
    else if (auto u = value.tryGet<std::uint32_t>()) out["value"] = *u;
    else if (auto u = value.tryGet<std::uint64_t>()) out["value"] = *u;
    else if (auto s = value.tryGet<std::string>()) out["value"] = *s;
    else if (auto a = value.tryGet<F64Array>()) out["value"] = *a;
    else if (auto c = value.tryGet<Color>()) out["value"] = colorToJson(*c);
    else if (auto p = value.tryGet<PathPoints>()) {
        json points = json::array();
        for (const auto& pt : *p) points.push_back({pt.x, pt.y});
        out["value"] = points;
    } else if (auto r = value.tryGet<Raster>()) {
        json pixels = json::array();
        for (const auto& c : r->pixels) pixels.push_back(colorToJson(c));
        out["value"] = {{"width", r->width}, {"height", r->height}, {"pixels", pixels}};
    } else if (value.holds<None>()) {
        out["value"] = nullptr;
    } else {
        out["value"] = value.toPrimitiveString();
    }
    return out;
}

Node nodeFromJson(const json& j) {
    Node node;
    node.id = j.at("id").get<NodeId>();
    node.name = j.value("name", std::string());
    if (j.contains("operation")) {
        node.implementation = PrimitiveImpl{j.at("operation").get<std::string>()};
    } else if (j.contains("network")) {
        node.implementation = NetworkImpl{j.at("network").get<std::string>()};
    } else if (j.contains("parameter")) {
        node.implementation = ParameterImpl{j.at("parameter").get<std::size_t>()};
    } else {
        throw std::runtime_error(fmt::format("Node {} needs one of operation, network or parameter", node.id));
    }
    if (j.contains("output")) node.outputType = parseType(j.at("output").get<std::string>());
    if (j.contains("inputs")) {
        for (const auto& in : j.at("inputs")) {
            NodeInput input;
            input.name = in.value("name", std::string());
            input.declaredType = parseType(in.value("type", std::string()));
            if (in.contains("node")) {
                input.source = Wire{in.at("node").get<NodeId>()};
            } else if (in.contains("value")) {
                input.source = Literal{literalFromJson(in.at("value"), input.declaredType)};
            } else {
                auto def = TaggedValue::fromType(input.declaredType);
                if (!def) throw std::runtime_error(fmt::format("Input '{}' of node {} has no source", input.name, node.id));
                input.source = Literal{*def};
            }
            node.inputs.push_back(std::move(input));
        }
    }
    return node;
}

json nodeToJson(const Node& n) {
    json j;
    j["id"] = n.id;
    if (!n.name.empty()) j["name"] = n.name;
    if (auto p = std::get_if<PrimitiveImpl>(&n.implementation)) j["operation"] = p->operation;
    else if (auto nw = std::get_if<NetworkImpl>(&n.implementation)) j["network"] = nw->definition;
    else j["parameter"] = std::get<ParameterImpl>(n.implementation).importIndex;
    if (!n.outputType.isInferred()) j["output"] = n.outputType.toString();
    json inputs = json::array();
    for (const auto& in : n.inputs) {
        json ij;
        if (!in.name.empty()) ij["name"] = in.name;
        if (auto w = in.wire()) {
            ij["node"] = w->node;
            if (!in.declaredType.isInferred()) ij["type"] = in.declaredType.toString();
        } else {
            json lit = literalToJson(in.literal()->value);
            ij["type"] = in.declaredType.isInferred() ? lit["type"] : json(in.declaredType.toString());
            ij["value"] = lit["value"];
        }
        inputs.push_back(std::move(ij));
    }
    j["inputs"] = std::move(inputs);
    return j;
}

Network networkFromJson(const json& j) {
    Network network;
    if (j.contains("imports")) {
        std::vector<Type> imports;
        for (const auto& t : j.at("imports")) imports.push_back(parseType(t.get<std::string>()));
        network.setImports(std::move(imports));
    }
    for (const auto& nj : j.at("nodes")) network.insertNode(nodeFromJson(nj));
    if (j.contains("export")) network.setExport(j.at("export").get<NodeId>());
    return network;
}

json networkToJson(const Network& network) {
    json j;
    json imports = json::array();
    for (const auto& t : network.imports()) imports.push_back(t.toString());
    if (!imports.empty()) j["imports"] = std::move(imports);
    json nodes = json::array();
    for (const auto& [id, n] : network.nodes()) nodes.push_back(nodeToJson(n));
    j["nodes"] = std::move(nodes);
    if (network.exported()) j["export"] = *network.exported();
    return j;
}

} // namespace

Graph loadGraphFromJson(const nlohmann::json& json) {
    Graph graph;
    try {
        graph.root() = networkFromJson(json);
        if (json.contains("definitions")) {
            for (const auto& [name, def] : json.at("definitions").items()) graph.defineNetwork(name, networkFromJson(def));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("Malformed flow document: {}", e.what()));
    }
    return graph;
}

nlohmann::json graphToJson(const Graph& graph) {
    nlohmann::json j = networkToJson(graph.root());
    if (!graph.definitions().empty()) {
        nlohmann::json defs = nlohmann::json::object();
        for (const auto& [name, def] : graph.definitions()) defs[name] = networkToJson(def);
        j["definitions"] = std::move(defs);
    }
    return j;
}

} // namespace NodeCraft

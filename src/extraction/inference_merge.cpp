#include <cartograph/extraction/inference_merge.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <initializer_list>
#include <string>

namespace cartograph::extraction {

using model::property;
using model::Provenance;
using nlohmann::json;

namespace {

/// Fold one inferred value into `current` following the syntactic-preferred rule.
template <typename T>
void mergeField(model::FieldProvenance& prov, const std::string& field, T& current,
                const json& inferred) {
    auto it = inferred.find(field);
    if (it == inferred.end() || it->is_null())
        return;
    T value;
    try {
        value = it->get<T>();
    } catch (const json::exception& e) {
        spdlog::debug("Ignoring inferred '{}' of unexpected type: {}", field, e.what());
        return;
    }
    if (prov.get(field) == Provenance::Syntactic) {
        if (value != current)
            prov.recordConflict(field, current, value);
        return;
    }
    current = std::move(value);
    prov.set(field, Provenance::Inferred);
}

void tagInferred(model::FieldProvenance& prov, const json& source,
                 std::initializer_list<const char*> fields) {
    for (const char* f : fields) {
        if (source.contains(f))
            prov.set(f, Provenance::Inferred);
    }
}

json argumentsToJson(const std::vector<model::Argument>& args) {
    json out = json::array();
    for (const auto& a : args)
        out.push_back({{"name", a.name}, {"type", a.type}});
    return out;
}

// Untyped (`Any`) arguments take the inferred type of the same-named argument.
void mergeArguments(model::FunctionRecord& fn, const json& inferred) {
    auto it = inferred.find("arguments");
    if (it == inferred.end() || !it->is_array())
        return;
    if (fn.provenance.get("arguments") == Provenance::Syntactic) {
        json current = argumentsToJson(fn.arguments);
        bool differs = false;
        for (const auto& a : *it) {
            auto name = property<std::string>(a, "name", "");
            auto type = property<std::string>(a, "type", "Any");
            auto match = std::find_if(fn.arguments.begin(), fn.arguments.end(),
                                      [&](const auto& x) { return x.name == name; });
            if (match != fn.arguments.end() && match->type != type)
                differs = true;
        }
        if (differs)
            fn.provenance.recordConflict("arguments", current, *it);
        return;
    }

    bool filled = false;
    if (fn.arguments.empty()) {
        for (const auto& a : *it) {
            auto name = property<std::string>(a, "name", "");
            if (name.empty())
                continue;
            fn.arguments.push_back({std::move(name), property<std::string>(a, "type", "Any")});
            filled = true;
        }
    } else {
        for (auto& arg : fn.arguments) {
            if (arg.type != "Any")
                continue;
            for (const auto& a : *it) {
                auto type = property<std::string>(a, "type", "Any");
                if (property<std::string>(a, "name", "") == arg.name && type != "Any") {
                    arg.type = std::move(type);
                    filled = true;
                }
            }
        }
    }
    if (filled)
        fn.provenance.set("arguments", Provenance::Inferred);
}

void mergeFunction(model::FunctionRecord& fn, const json& inferred) {
    mergeField(fn.provenance, "return_type", fn.returnType, inferred);
    mergeField(fn.provenance, "is_static", fn.isStatic, inferred);
    mergeField(fn.provenance, "is_async", fn.isAsync, inferred);
    mergeField(fn.provenance, "decorators", fn.decorators, inferred);
    mergeField(fn.provenance, "docstring", fn.docstring, inferred);
    mergeArguments(fn, inferred);
}

void mergeClass(model::ClassRecord& cls, const json& inferred) {
    mergeField(cls.provenance, "type", cls.kind, inferred);
    mergeField(cls.provenance, "is_static", cls.isStatic, inferred);
    mergeField(cls.provenance, "is_final", cls.isFinal, inferred);
    mergeField(cls.provenance, "superclasses", cls.superclasses, inferred);
    mergeField(cls.provenance, "interfaces", cls.interfaces, inferred);
    mergeField(cls.provenance, "docstring", cls.docstring, inferred);
    if (cls.attributes.empty() && !cls.provenance.get("attributes")) {
        auto it = inferred.find("attributes");
        if (it != inferred.end() && it->is_array() && !it->empty()) {
            cls.attributes = model::ClassRecord::fromProperties({{"attributes", *it}}).attributes;
            if (!cls.attributes.empty())
                cls.provenance.set("attributes", Provenance::Inferred);
        }
    }
}

std::string inferredQualifiedName(const json& fn) {
    auto cls = property<std::string>(fn, "class_name", "");
    auto name = property<std::string>(fn, "name", "");
    return cls.empty() ? name : cls + "." + name;
}

const json& arrayOrEmpty(const json& doc, const char* key) {
    static const json empty = json::array();
    auto it = doc.find(key);
    return (it != doc.end() && it->is_array()) ? *it : empty;
}

} // namespace

json skeletonToJson(const Skeleton& skeleton) {
    json doc = {{"functions", json::array()},
                {"classes", json::array()},
                {"enums", json::array()},
                {"extensions", json::array()},
                {"imports", json::array()},
                {"partial", skeleton.partial}};
    for (const auto& f : skeleton.functions)
        doc["functions"].push_back(f.toProperties());
    for (const auto& c : skeleton.classes)
        doc["classes"].push_back(c.toProperties());
    for (const auto& e : skeleton.enums)
        doc["enums"].push_back(e.toProperties());
    for (const auto& x : skeleton.extensions)
        doc["extensions"].push_back(x.toProperties());
    for (const auto& imp : skeleton.imports) {
        json bindings = json::array();
        for (const auto& [local, imported] : imp.bindings)
            bindings.push_back({{"local", local}, {"imported", imported}});
        doc["imports"].push_back({{"module", imp.module},
                                  {"level", imp.level},
                                  {"from", imp.fromImport},
                                  {"bindings", std::move(bindings)}});
    }
    return doc;
}

bool needsInference(const Skeleton& skeleton) {
    for (const auto& c : skeleton.classes) {
        if (!c.provenance.get("type"))
            return true;
    }
    auto untyped = [](const model::FunctionRecord& f) {
        return !f.provenance.get("return_type") || !f.provenance.get("arguments");
    };
    for (const auto& f : skeleton.functions) {
        if (untyped(f))
            return true;
    }
    for (const auto& c : skeleton.classes) {
        if (std::any_of(c.methodDetails.begin(), c.methodDetails.end(), untyped))
            return true;
    }
    return false;
}

std::vector<std::string> mergeInferred(Skeleton& skeleton, const json& inferred) {
    std::vector<std::string> references;
    if (!inferred.is_object())
        return references;

    for (const auto& jc : arrayOrEmpty(inferred, "classes")) {
        auto name = property<std::string>(jc, "name", "");
        if (name.empty())
            continue;
        auto it = std::find_if(skeleton.classes.begin(), skeleton.classes.end(),
                               [&](const auto& c) { return c.name == name; });
        if (it != skeleton.classes.end()) {
            mergeClass(*it, jc);
            continue;
        }
        auto cls = model::ClassRecord::fromProperties(jc);
        cls.provenance = {};
        cls.methods.clear();
        cls.methodDetails.clear();
        tagInferred(cls.provenance, jc,
                    {"name", "type", "is_static", "is_final", "superclasses", "interfaces",
                     "attributes", "docstring"});
        skeleton.classes.push_back(std::move(cls));
    }

    // After classes, so inferred methods can attach to inferred classes
    for (const auto& jf : arrayOrEmpty(inferred, "functions")) {
        auto name = property<std::string>(jf, "name", "");
        if (name.empty())
            continue;
        auto className = property<std::string>(jf, "class_name", "");
        std::vector<model::FunctionRecord>* target = &skeleton.functions;
        model::ClassRecord* owner = nullptr;
        if (!className.empty()) {
            auto cls = std::find_if(skeleton.classes.begin(), skeleton.classes.end(),
                                    [&](const auto& c) { return c.name == className; });
            if (cls == skeleton.classes.end()) {
                spdlog::debug("Inferred method {} has no class in the skeleton",
                              inferredQualifiedName(jf));
                continue;
            }
            owner = &*cls;
            target = &cls->methodDetails;
        }
        auto it = std::find_if(target->begin(), target->end(),
                               [&](const auto& f) { return f.name == name; });
        if (it != target->end()) {
            mergeFunction(*it, jf);
            continue;
        }
        auto fn = model::FunctionRecord::fromProperties(jf);
        fn.provenance = {};
        tagInferred(fn.provenance, jf,
                    {"name", "return_type", "arguments", "decorators", "is_static", "is_async",
                     "docstring"});
        if (owner)
            owner->methods.push_back(fn.name);
        target->push_back(std::move(fn));
    }

    for (const auto& je : arrayOrEmpty(inferred, "enums")) {
        auto name = property<std::string>(je, "name", "");
        if (name.empty())
            continue;
        auto it = std::find_if(skeleton.enums.begin(), skeleton.enums.end(),
                               [&](const auto& e) { return e.name == name; });
        if (it != skeleton.enums.end()) {
            mergeField(it->provenance, "values", it->values, je);
            mergeField(it->provenance, "docstring", it->docstring, je);
            continue;
        }
        auto en = model::EnumRecord::fromProperties(je);
        en.provenance = {};
        tagInferred(en.provenance, je, {"name", "values", "docstring"});
        skeleton.enums.push_back(std::move(en));
    }

    for (const auto& jx : arrayOrEmpty(inferred, "extensions")) {
        auto name = property<std::string>(jx, "name", "");
        if (name.empty())
            continue;
        auto it = std::find_if(skeleton.extensions.begin(), skeleton.extensions.end(),
                               [&](const auto& x) { return x.name == name; });
        if (it != skeleton.extensions.end()) {
            mergeField(it->provenance, "base_type", it->baseType, jx);
            continue;
        }
        auto ext = model::ExtensionRecord::fromProperties(jx);
        ext.provenance = {};
        tagInferred(ext.provenance, jx, {"name", "base_type", "methods"});
        skeleton.extensions.push_back(std::move(ext));
    }

    for (const auto& r : arrayOrEmpty(inferred, "references")) {
        if (r.is_string() && !r.get<std::string>().empty())
            references.push_back(r.get<std::string>());
        else if (r.is_object() && r.contains("target") && r["target"].is_string())
            references.push_back(r["target"].get<std::string>());
    }
    return references;
}

} // namespace cartograph::extraction

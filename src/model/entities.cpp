#include <cartograph/model/entities.h>

#include <array>
#include <initializer_list>
#include <utility>

namespace cartograph::model {

using nlohmann::json;

namespace {

constexpr std::array<std::pair<ProjectStatus, const char*>, 9> kStatuses{{
    {ProjectStatus::Uploaded, "uploaded"},
    {ProjectStatus::StructureAnalyzed, "structure_analyzed"},
    {ProjectStatus::ContentAnalyzed, "content_analyzed"},
    {ProjectStatus::Classified, "classified"},
    {ProjectStatus::Mapped, "mapped"},
    {ProjectStatus::Strategized, "strategized"},
    {ProjectStatus::Done, "done"},
    {ProjectStatus::Failed, "failed"},
    {ProjectStatus::NeedsFeedback, "needs_feedback"},
}};

// Keys of `props` not in `known` (provenance keys included) land in the extra bag.
json extraProperties(const json& props, std::initializer_list<const char*> known) {
    json extra = json::object();
    if (!props.is_object())
        return extra;
    for (auto it = props.begin(); it != props.end(); ++it) {
        if (it.key() == "_provenance" || it.key() == "_conflicts")
            continue;
        bool isKnown = false;
        for (const char* k : known) {
            if (it.key() == k) {
                isKnown = true;
                break;
            }
        }
        if (!isKnown)
            extra[it.key()] = it.value();
    }
    return extra;
}

// Extra properties never shadow typed fields.
void mergeExtra(json& props, const json& extra) {
    if (!extra.is_object())
        return;
    for (auto it = extra.begin(); it != extra.end(); ++it) {
        if (!props.contains(it.key()))
            props[it.key()] = it.value();
    }
}

std::vector<std::string> getStrings(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.is_object())
        return out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array())
        return out;
    for (const auto& v : *it) {
        if (v.is_string())
            out.push_back(v.get<std::string>());
    }
    return out;
}

} // namespace

const char* toString(ProjectStatus status) {
    for (const auto& [s, name] : kStatuses) {
        if (s == status)
            return name;
    }
    return "failed";
}

std::optional<ProjectStatus> parseProjectStatus(std::string_view s) {
    for (const auto& [status, name] : kStatuses) {
        if (s == name)
            return status;
    }
    return std::nullopt;
}

// FieldProvenance

std::optional<Provenance> FieldProvenance::get(const std::string& field) const {
    auto it = fields.find(field);
    if (it == fields.end())
        return std::nullopt;
    return it->second;
}

void FieldProvenance::recordConflict(const std::string& field, const json& syntactic,
                                     const json& inferred) {
    conflicts.push_back({{"field", field},
                         {"syntactic", syntactic},
                         {"inferred", inferred},
                         {"chosen", toString(Provenance::Syntactic)}});
}

void FieldProvenance::writeTo(json& props) const {
    json p = json::object();
    for (const auto& [field, prov] : fields) {
        p[field] = toString(prov);
    }
    props["_provenance"] = std::move(p);
    if (!conflicts.empty()) {
        props["_conflicts"] = conflicts;
    }
}

FieldProvenance FieldProvenance::readFrom(const json& props) {
    FieldProvenance fp;
    if (!props.is_object())
        return fp;
    if (auto it = props.find("_provenance"); it != props.end() && it->is_object()) {
        for (auto f = it->begin(); f != it->end(); ++f) {
            if (f->is_string()) {
                fp.fields[f.key()] = f->get<std::string>() == "inferred" ? Provenance::Inferred
                                                                         : Provenance::Syntactic;
            }
        }
    }
    if (auto it = props.find("_conflicts"); it != props.end() && it->is_array()) {
        fp.conflicts = *it;
    }
    return fp;
}

// ProjectRecord

json ProjectRecord::toProperties() const {
    json j = {{"project_id", id},
              {"root_path", rootPath},
              {"storage_path", storagePath},
              {"status", toString(status)},
              {"progress", progress},
              {"current_step", currentStep},
              {"created_at", createdAt},
              {"updated_at", updatedAt}};
    j["resume_status"] = resumeStatus ? json(toString(*resumeStatus)) : json(nullptr);
    mergeExtra(j, extra);
    return j;
}

ProjectRecord ProjectRecord::fromProperties(const std::string& id, const json& props) {
    ProjectRecord p;
    p.id = id;
    p.rootPath = property<std::string>(props, "root_path", "");
    p.storagePath = property<std::string>(props, "storage_path", "");
    p.status = parseProjectStatus(property<std::string>(props, "status", "uploaded"))
                   .value_or(ProjectStatus::Failed);
    if (auto rs = property<std::string>(props, "resume_status", ""); !rs.empty()) {
        p.resumeStatus = parseProjectStatus(rs);
    }
    p.progress = property<double>(props, "progress", 0.0);
    p.currentStep = property<std::string>(props, "current_step", "");
    p.createdAt = property<std::string>(props, "created_at", "");
    p.updatedAt = property<std::string>(props, "updated_at", "");
    p.extra = extraProperties(props, {"project_id", "root_path", "storage_path", "status",
                                      "resume_status", "progress", "current_step", "created_at",
                                      "updated_at"});
    return p;
}

// FileRecord

json FileRecord::toProperties() const {
    json j = {{"path", path},
              {"absolute_path", absolutePath},
              {"file_type", language},
              {"extension", extension},
              {"size", size},
              {"parse_failed", parseFailed}};
    mergeExtra(j, extra);
    return j;
}

FileRecord FileRecord::fromProperties(const json& props) {
    FileRecord f;
    f.path = property<std::string>(props, "path", "");
    f.absolutePath = property<std::string>(props, "absolute_path", "");
    f.language = property<std::string>(props, "file_type", "unknown");
    f.extension = property<std::string>(props, "extension", "");
    f.size = property<uint64_t>(props, "size", 0);
    f.parseFailed = property<bool>(props, "parse_failed", false);
    f.extra = extraProperties(
        props, {"path", "absolute_path", "file_type", "extension", "size", "parse_failed"});
    return f;
}

// FunctionRecord

std::string FunctionRecord::qualifiedName() const {
    return className.empty() ? name : className + "." + name;
}

json FunctionRecord::toProperties() const {
    json args = json::array();
    for (const auto& a : arguments) {
        args.push_back({{"name", a.name}, {"type", a.type}});
    }
    json j = {{"name", name},
              {"class_name", className},
              {"return_type", returnType},
              {"arguments", std::move(args)},
              {"decorators", decorators},
              {"is_static", isStatic},
              {"is_async", isAsync},
              {"docstring", docstring},
              {"lineno", lineno},
              {"end_lineno", endLineno}};
    provenance.writeTo(j);
    mergeExtra(j, extra);
    return j;
}

FunctionRecord FunctionRecord::fromProperties(const json& props) {
    FunctionRecord f;
    f.name = property<std::string>(props, "name", "");
    f.className = property<std::string>(props, "class_name", "");
    f.returnType = property<std::string>(props, "return_type", "Any");
    if (auto it = props.find("arguments"); it != props.end() && it->is_array()) {
        for (const auto& a : *it) {
            if (!a.is_object())
                continue;
            f.arguments.push_back(
                {property<std::string>(a, "name", ""), property<std::string>(a, "type", "Any")});
        }
    }
    f.decorators = getStrings(props, "decorators");
    f.isStatic = property<bool>(props, "is_static", false);
    f.isAsync = property<bool>(props, "is_async", false);
    f.docstring = property<std::string>(props, "docstring", "");
    f.lineno = property<int>(props, "lineno", 0);
    f.endLineno = property<int>(props, "end_lineno", 0);
    f.provenance = FieldProvenance::readFrom(props);
    f.extra = extraProperties(props, {"name", "class_name", "return_type", "arguments",
                                      "decorators", "is_static", "is_async", "docstring",
                                      "lineno", "end_lineno"});
    return f;
}

// ClassRecord

json ClassRecord::toProperties() const {
    json attrs = json::array();
    for (const auto& a : attributes) {
        attrs.push_back({{"name", a.name}, {"type", a.type}, {"visibility", a.visibility}});
    }
    json j = {{"name", name},
              {"type", kind},
              {"is_static", isStatic},
              {"is_final", isFinal},
              {"superclasses", superclasses},
              {"interfaces", interfaces},
              {"methods", methods},
              {"method_details", json::array()},
              {"attributes", std::move(attrs)},
              {"docstring", docstring},
              {"lineno", lineno},
              {"end_lineno", endLineno}};
    for (const auto& m : methodDetails) {
        j["method_details"].push_back(m.toProperties());
    }
    provenance.writeTo(j);
    mergeExtra(j, extra);
    return j;
}

ClassRecord ClassRecord::fromProperties(const json& props) {
    ClassRecord c;
    c.name = property<std::string>(props, "name", "");
    c.kind = property<std::string>(props, "type", "regular");
    c.isStatic = property<bool>(props, "is_static", false);
    c.isFinal = property<bool>(props, "is_final", false);
    c.superclasses = getStrings(props, "superclasses");
    c.interfaces = getStrings(props, "interfaces");
    c.methods = getStrings(props, "methods");
    if (auto it = props.find("method_details"); it != props.end() && it->is_array()) {
        for (const auto& m : *it) {
            c.methodDetails.push_back(FunctionRecord::fromProperties(m));
        }
    }
    if (auto it = props.find("attributes"); it != props.end() && it->is_array()) {
        for (const auto& a : *it) {
            if (!a.is_object())
                continue;
            c.attributes.push_back({property<std::string>(a, "name", ""),
                                    property<std::string>(a, "type", "Any"),
                                    property<std::string>(a, "visibility", "public")});
        }
    }
    c.docstring = property<std::string>(props, "docstring", "");
    c.lineno = property<int>(props, "lineno", 0);
    c.endLineno = property<int>(props, "end_lineno", 0);
    c.provenance = FieldProvenance::readFrom(props);
    c.extra = extraProperties(props, {"name", "type", "is_static", "is_final", "superclasses",
                                      "interfaces", "methods", "method_details", "attributes",
                                      "docstring", "lineno", "end_lineno"});
    return c;
}

// EnumRecord

json EnumRecord::toProperties() const {
    json j = {{"name", name}, {"values", values}, {"docstring", docstring}, {"lineno", lineno}};
    provenance.writeTo(j);
    mergeExtra(j, extra);
    return j;
}

EnumRecord EnumRecord::fromProperties(const json& props) {
    EnumRecord e;
    e.name = property<std::string>(props, "name", "");
    e.values = getStrings(props, "values");
    e.docstring = property<std::string>(props, "docstring", "");
    e.lineno = property<int>(props, "lineno", 0);
    e.provenance = FieldProvenance::readFrom(props);
    e.extra = extraProperties(props, {"name", "values", "docstring", "lineno"});
    return e;
}

// ExtensionRecord

json ExtensionRecord::toProperties() const {
    json j = {{"name", name}, {"base_type", baseType}, {"methods", methods}};
    provenance.writeTo(j);
    mergeExtra(j, extra);
    return j;
}

ExtensionRecord ExtensionRecord::fromProperties(const json& props) {
    ExtensionRecord e;
    e.name = property<std::string>(props, "name", "");
    e.baseType = property<std::string>(props, "base_type", "");
    e.methods = getStrings(props, "methods");
    e.provenance = FieldProvenance::readFrom(props);
    e.extra = extraProperties(props, {"name", "base_type", "methods"});
    return e;
}

// DependencyRecord

json DependencyRecord::toProperties() const {
    return {{"name", name}, {"version", version}, {"type", type}};
}

DependencyRecord DependencyRecord::fromProperties(const json& props) {
    DependencyRecord d;
    d.name = property<std::string>(props, "name", "");
    d.version = property<std::string>(props, "version", "");
    d.type = property<std::string>(props, "type", "external");
    return d;
}

// ComponentRecord

json ComponentRecord::toProperties() const {
    return {{"file", filePath},
            {"type", toString(type)},
            {"signals", signals},
            {"_provenance", {{"type", toString(provenance)}}}};
}

ComponentRecord ComponentRecord::fromProperties(const json& props) {
    ComponentRecord c;
    c.filePath = property<std::string>(props, "file", "");
    c.type = parseComponentType(property<std::string>(props, "type", "unknown"))
                 .value_or(ComponentType::Unknown);
    c.signals = getStrings(props, "signals");
    auto fp = FieldProvenance::readFrom(props);
    c.provenance = fp.get("type").value_or(Provenance::Syntactic);
    return c;
}

// TargetComponentRecord

json TargetComponentRecord::toProperties() const {
    return {{"name", name}, {"version", version}, {"type", type}};
}

TargetComponentRecord TargetComponentRecord::fromProperties(const json& props) {
    return {property<std::string>(props, "name", ""), property<std::string>(props, "version", ""),
            property<std::string>(props, "type", "")};
}

// MappingRecord

json MappingRecord::toProperties() const {
    json types = json::object();
    for (const auto& [from, to] : dataTypeMapping) {
        types[from] = to;
    }
    return {{"source", sourceKey},
            {"target", targetKey},
            {"data_type_mapping", std::move(types)},
            {"is_custom", isCustom},
            {"best_effort", bestEffort},
            {"_provenance", {{"target", toString(provenance)}}}};
}

MappingRecord MappingRecord::fromProperties(const json& props) {
    MappingRecord m;
    m.sourceKey = property<std::string>(props, "source", "");
    m.targetKey = property<std::string>(props, "target", "");
    if (auto it = props.find("data_type_mapping"); it != props.end() && it->is_object()) {
        for (auto t = it->begin(); t != it->end(); ++t) {
            if (t->is_string())
                m.dataTypeMapping[t.key()] = t->get<std::string>();
        }
    }
    m.isCustom = property<bool>(props, "is_custom", false);
    m.bestEffort = property<bool>(props, "best_effort", false);
    m.provenance = FieldProvenance::readFrom(props).get("target").value_or(Provenance::Syntactic);
    return m;
}

// StrategyRecord

json StrategyRecord::toProperties() const {
    return {{"component", componentKey}, {"priority", priority}, {"actions", actions}};
}

StrategyRecord StrategyRecord::fromProperties(const json& props) {
    StrategyRecord s;
    s.componentKey = property<std::string>(props, "component", "");
    s.priority = property<int64_t>(props, "priority", 0);
    s.actions = getStrings(props, "actions");
    return s;
}

// ReportRecord

json ReportRecord::toProperties() const {
    json j = {{"report_id", id},
              {"type", type},
              {"issue", issue},
              {"details", details},
              {"created_at", createdAt},
              {"last_seen", lastSeen.empty() ? createdAt : lastSeen},
              {"occurrences", occurrences}};
    if (!errorKind.empty()) {
        j["error_kind"] = errorKind;
    }
    return j;
}

ReportRecord ReportRecord::fromProperties(const std::string& id, const json& props) {
    ReportRecord r;
    r.id = id;
    r.type = property<std::string>(props, "type", "");
    r.issue = property<std::string>(props, "issue", "");
    r.errorKind = property<std::string>(props, "error_kind", "");
    if (auto it = props.find("details"); it != props.end()) {
        r.details = *it;
    }
    r.createdAt = property<std::string>(props, "created_at", "");
    r.lastSeen = property<std::string>(props, "last_seen", r.createdAt);
    r.occurrences = property<int64_t>(props, "occurrences", 1);
    return r;
}

} // namespace cartograph::model

#include <cartograph/extraction/extraction_engine.h>
#include <cartograph/extraction/file_scanner.h>
#include <cartograph/extraction/inference_merge.h>
#include <cartograph/graph/report_writer.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace cartograph::extraction {

using graph::NodeRef;
using graph::WriteBatch;
using model::NodeLabel;
using model::Relation;
using nlohmann::json;

namespace {

std::string joinPath(const std::string& a, const std::string& b) {
    if (a.empty())
        return b;
    if (b.empty())
        return a;
    return a + "/" + b;
}

std::string dottedToPath(std::string_view module) {
    std::string out(module);
    std::replace(out.begin(), out.end(), '.', '/');
    return out;
}

std::string topSegment(std::string_view module) {
    auto pos = module.find('.');
    return std::string(module.substr(0, pos));
}

// Directory that a relative import of `level` dots starts from; nullopt above root.
std::optional<std::string> relativeBase(const std::string& filePath, int level) {
    std::string dir;
    if (auto slash = filePath.rfind('/'); slash != std::string::npos)
        dir = filePath.substr(0, slash);
    for (int i = 1; i < level; ++i) {
        if (dir.empty())
            return std::nullopt;
        auto slash = dir.rfind('/');
        dir = slash == std::string::npos ? std::string{} : dir.substr(0, slash);
    }
    return dir;
}

bool looksLikePath(std::string_view ref) {
    return ref.find('/') != std::string_view::npos || ref.ends_with(".py");
}

json pendingProperties(const ImportDecl& decl, const std::string& dependency) {
    return {{"module", std::string(decl.level, '.') + decl.module},
            {"level", decl.level},
            {"lineno", decl.lineno},
            {"dependency", dependency},
            {"dependency_type", decl.level > 0 ? "internal" : "external"}};
}

} // namespace

ExtractionStats& ExtractionStats::operator+=(const ExtractionStats& other) {
    files += other.files;
    parsed += other.parsed;
    parseFailures += other.parseFailures;
    oversized += other.oversized;
    functions += other.functions;
    classes += other.classes;
    enums += other.enums;
    extensions += other.extensions;
    imports += other.imports;
    references += other.references;
    dependencies += other.dependencies;
    inferenceCalls += other.inferenceCalls;
    inferenceFailures += other.inferenceFailures;
    return *this;
}

json ExtractionStats::toJson() const {
    return {{"files", files},
            {"parsed", parsed},
            {"parse_failures", parseFailures},
            {"oversized", oversized},
            {"functions", functions},
            {"classes", classes},
            {"enums", enums},
            {"extensions", extensions},
            {"imports", imports},
            {"references", references},
            {"dependencies", dependencies},
            {"inference_calls", inferenceCalls},
            {"inference_failures", inferenceFailures}};
}

std::vector<std::string> moduleCandidates(std::string_view module) {
    if (module.empty())
        return {};
    auto base = dottedToPath(module);
    return {base + ".py", base + "/__init__.py"};
}

std::vector<std::string> importCandidates(const std::string& filePath, const ImportDecl& decl,
                                          const std::string& binding) {
    std::string prefix;
    if (decl.level > 0) {
        auto base = relativeBase(filePath, decl.level);
        if (!base)
            return {};
        prefix = joinPath(*base, dottedToPath(decl.module));
    } else {
        prefix = dottedToPath(decl.module);
    }

    std::vector<std::string> out;
    if (!binding.empty() && binding != "*") {
        auto sub = joinPath(prefix, dottedToPath(binding));
        out.push_back(sub + ".py");
        out.push_back(sub + "/__init__.py");
    }
    if (!decl.module.empty())
        out.push_back(prefix + ".py");
    if (!prefix.empty())
        out.push_back(prefix + "/__init__.py");
    return out;
}

ExtractionEngine::ExtractionEngine(graph::GraphStore& store, SyntaxParser& parser,
                                   InferenceClient* inference, ExtractionOptions options)
    : store_(store), parser_(parser), inference_(inference), options_(options) {
    if (options_.workers == 0)
        options_.workers = 1;
}

Result<ExtractionStats> ExtractionEngine::scanStructure(const std::string& projectId,
                                                        const std::filesystem::path& root) {
    auto scanR = scanProject(root, ScanOptions{options_.skipHidden});
    if (!scanR)
        return scanR.error();
    const auto& files = scanR.value();

    WriteBatch batch;
    const NodeRef project{NodeLabel::Project, projectId};
    json languages = json::object();
    for (const auto& file : files) {
        auto props = file.toProperties();
        // parse_failed belongs to content analysis
        props.erase("parse_failed");
        batch.upsertNode(NodeLabel::File, model::keys::file(file.path), std::move(props));
        batch.upsertEdge(Relation::Contains, project, {NodeLabel::File, model::keys::file(file.path)});
        languages[file.language] = languages.value(file.language, 0) + 1;
    }

    ExtractionStats stats;
    stats.files = files.size();
    graph::addReport(batch, projectId,
                     graph::makeReport("structure_analysis",
                                       fmt::format("Scanned {} files", files.size()), projectId,
                                       {{"files", files.size()}, {"languages", languages}}));

    auto applyR = store_.apply(projectId, batch);
    if (!applyR)
        return applyR.error();
    spdlog::info("Structure analysis of {}: {} files", projectId, files.size());
    return stats;
}

Result<std::string> ExtractionEngine::readContents(const model::FileRecord& file) const {
    std::ifstream in(file.absolutePath, std::ios::binary);
    if (!in)
        return Error{ErrorCode::FileNotFound, "Cannot open " + file.absolutePath};
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return Error{ErrorCode::InternalError, "Read error on " + file.absolutePath};
    return ss.str();
}

Result<ExtractionStats> ExtractionEngine::extractFile(const std::string& projectId,
                                                      const model::FileRecord& file) {
    ExtractionStats stats;
    stats.files = 1;
    WriteBatch batch;
    model::FileRecord record = file;
    record.parseFailed = false;
    const std::string fileKey = model::keys::file(file.path);
    const NodeRef fileRef{NodeLabel::File, fileKey};

    auto commit = [&]() -> Result<ExtractionStats> {
        auto applyR = store_.apply(projectId, batch);
        if (!applyR)
            return applyR.error();
        return stats;
    };

    if (file.size > options_.maxFileSize) {
        spdlog::warn("Skipping content of {} ({} bytes exceeds {})", file.path, file.size,
                     options_.maxFileSize);
        stats.oversized = 1;
        batch.upsertNode(NodeLabel::File, fileKey, record.toProperties());
        graph::addReport(batch, projectId,
                         graph::makeReport("file_too_large",
                                           fmt::format("{} exceeds the size limit", file.path),
                                           file.path,
                                           {{"path", file.path},
                                            {"size", file.size},
                                            {"limit", options_.maxFileSize}}));
        return commit();
    }

    auto contentsR = readContents(file);
    if (!contentsR) {
        spdlog::warn("Cannot read {}: {}", file.path, contentsR.error().message);
        batch.upsertNode(NodeLabel::File, fileKey, record.toProperties());
        graph::addReport(batch, projectId,
                         graph::makeReport("file_unreadable", contentsR.error().message, file.path,
                                           {{"path", file.path}}, contentsR.error().code));
        return commit();
    }
    const std::string& contents = contentsR.value();

    Skeleton skeleton;
    bool parsed = false;
    if (parser_.supports(file.language)) {
        auto parseR = parser_.parse(contents, file.language);
        if (parseR) {
            skeleton = std::move(parseR).value();
            parsed = true;
        } else if (parseR.error().code != ErrorCode::NotSupported) {
            spdlog::warn("Parse of {} failed: {}", file.path, parseR.error().message);
            stats.parseFailures = 1;
            record.parseFailed = true;
            batch.upsertNode(NodeLabel::File, fileKey, record.toProperties());
            graph::addReport(batch, projectId,
                             graph::makeReport("parse_error", parseR.error().message, file.path,
                                               {{"path", file.path},
                                                {"language", file.language},
                                                {"size", file.size}},
                                               ErrorCode::MalformedInput));
            return commit();
        }
    }
    stats.parsed = parsed ? 1 : 0;

    std::vector<std::string> inferredRefs;
    if (inference_ && isSourceLanguage(file.language) && (!parsed || needsInference(skeleton))) {
        stats.inferenceCalls = 1;
        InferenceRequest request{"extract", projectId, file.path, file.language,
                                 {{"skeleton", skeletonToJson(skeleton)}, {"source", contents}}};
        auto inferR = inference_->infer(request, options_.inferenceTimeout);
        std::optional<Error> inferenceError;
        if (inferR) {
            // Merge into a copy so a rejected response leaves the parser output untouched
            Skeleton merged = skeleton;
            try {
                inferredRefs = mergeInferred(merged, inferR.value());
                skeleton = std::move(merged);
            } catch (const nlohmann::json::exception& e) {
                inferredRefs.clear();
                inferenceError = Error{ErrorCode::InferenceUnavailable,
                                       fmt::format("Unusable inference response: {}", e.what())};
            }
        } else {
            inferenceError = inferR.error();
        }
        if (inferenceError) {
            spdlog::warn("Inference for {} failed: {}", file.path, inferenceError->message);
            stats.inferenceFailures = 1;
            graph::addFeedback(batch, projectId,
                               graph::makeReport("inference_failed", inferenceError->message,
                                                 file.path,
                                                 {{"path", file.path}, {"task", "extract"}},
                                                 inferenceError->code));
        }
    }

    batch.upsertNode(NodeLabel::File, fileKey, record.toProperties());

    // Later duplicates of a name get ~2, ~3, ...
    std::unordered_map<std::string, int> seen;
    for (const auto& fn : skeleton.functions) {
        auto qn = fn.qualifiedName();
        int n = ++seen[qn];
        auto key = model::keys::function(file.path, n == 1 ? qn : qn + "~" + std::to_string(n));
        batch.upsertNode(NodeLabel::Function, key, fn.toProperties());
        batch.upsertEdge(Relation::HasFunction, fileRef, {NodeLabel::Function, key});
    }
    for (const auto& cls : skeleton.classes) {
        auto key = model::keys::classKey(file.path, cls.name);
        batch.upsertNode(NodeLabel::Class, key, cls.toProperties());
        batch.upsertEdge(Relation::HasClass, fileRef, {NodeLabel::Class, key});
    }
    for (const auto& en : skeleton.enums) {
        auto key = model::keys::enumKey(file.path, en.name);
        batch.upsertNode(NodeLabel::Enum, key, en.toProperties());
        batch.upsertEdge(Relation::HasEnum, fileRef, {NodeLabel::Enum, key});
    }
    for (const auto& ext : skeleton.extensions) {
        auto key = model::keys::extension(file.path, ext.name);
        batch.upsertNode(NodeLabel::Extension, key, ext.toProperties());
        batch.upsertEdge(Relation::HasExtension, fileRef, {NodeLabel::Extension, key});
    }
    stats.functions = skeleton.functions.size();
    stats.classes = skeleton.classes.size();
    stats.enums = skeleton.enums.size();
    stats.extensions = skeleton.extensions.size();

    // Local name -> candidates, for name references
    std::unordered_map<std::string, std::vector<std::string>> bound;
    for (const auto& decl : skeleton.imports) {
        auto addImport = [&](const std::string& binding, const std::string& dependency) {
            graph::PendingEdge edge;
            edge.source = fileRef;
            edge.relation = Relation::Imports;
            edge.target = std::string(decl.level, '.') + decl.module;
            edge.candidates = importCandidates(file.path, decl, binding);
            edge.properties = pendingProperties(decl, dependency);
            batch.addPending(std::move(edge));
        };

        if (decl.fromImport && !decl.bindings.empty()) {
            for (const auto& [local, imported] : decl.bindings) {
                auto dependency = decl.module.empty() ? imported : topSegment(decl.module);
                addImport(imported, dependency);
                if (imported != "*")
                    bound[local] = importCandidates(file.path, decl, imported);
            }
        } else {
            addImport({}, topSegment(decl.module));
            for (const auto& [local, imported] : decl.bindings)
                bound[local] = importCandidates(file.path, decl);
        }
    }

    std::unordered_set<std::string> referenced;
    for (const auto& ref : skeleton.references) {
        auto it = bound.find(ref.name);
        if (it == bound.end() || !referenced.insert(ref.name).second)
            continue;
        graph::PendingEdge edge;
        edge.source = fileRef;
        edge.relation = Relation::References;
        edge.target = ref.name;
        edge.candidates = it->second;
        edge.properties = {{"name", ref.name}, {"lineno", ref.lineno}};
        batch.addPending(std::move(edge));
    }
    for (const auto& target : inferredRefs) {
        graph::PendingEdge edge;
        edge.source = fileRef;
        edge.relation = Relation::References;
        edge.target = target;
        if (looksLikePath(target)) {
            edge.candidates = {target};
        } else {
            edge.candidates = moduleCandidates(target);
        }
        edge.properties = {{"name", target}, {"_provenance", {{"target", "inferred"}}}};
        batch.addPending(std::move(edge));
    }

    spdlog::debug("Extracted {}: {} functions, {} classes, {} imports", file.path,
                  stats.functions, stats.classes, skeleton.imports.size());
    return commit();
}

Result<ExtractionStats> ExtractionEngine::extractContent(const std::string& projectId) {
    auto nodesR = store_.findNodes(projectId, NodeLabel::File);
    if (!nodesR)
        return nodesR.error();

    std::vector<model::FileRecord> files;
    files.reserve(nodesR.value().size());
    for (const auto& node : nodesR.value())
        files.push_back(model::FileRecord::fromProperties(node.properties));

    std::vector<ExtractionStats> results(files.size());
    std::vector<std::optional<Error>> errors(files.size());
    {
        boost::asio::thread_pool pool{std::min(options_.workers, std::max<size_t>(1, files.size()))};
        for (size_t i = 0; i < files.size(); ++i) {
            boost::asio::post(pool, [&, i] {
                try {
                    auto r = extractFile(projectId, files[i]);
                    if (r)
                        results[i] = r.value();
                    else
                        errors[i] = r.error();
                } catch (const std::exception& e) {
                    errors[i] = Error{ErrorCode::InternalError,
                                      fmt::format("Extraction of {} threw: {}", files[i].path,
                                                  e.what())};
                }
            });
        }
        pool.join();
    }

    ExtractionStats total;
    std::optional<Error> firstError;
    size_t failed = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        if (errors[i]) {
            ++failed;
            if (!firstError)
                firstError = errors[i];
            continue;
        }
        total += results[i];
    }
    if (firstError) {
        spdlog::error("Content analysis of {}: {} of {} files not stored: {}", projectId, failed,
                      files.size(), firstError->message);
        return *firstError;
    }

    auto resolveR = resolvePending(projectId);
    if (!resolveR)
        return resolveR.error();
    total += resolveR.value();

    auto reportR = graph::writeReport(
        store_, projectId,
        graph::makeReport("content_analysis",
                          fmt::format("Extracted {} files ({} parse failures)", total.files,
                                      total.parseFailures),
                          projectId, total.toJson()));
    if (!reportR)
        return reportR.error();

    spdlog::info("Content analysis of {}: {} files, {} functions, {} classes, {} imports, {} "
                 "references",
                 projectId, total.files, total.functions, total.classes, total.imports,
                 total.references);
    return total;
}

Result<ExtractionStats> ExtractionEngine::resolvePending(const std::string& projectId) {
    auto pendingR = store_.pendingEdges(projectId);
    if (!pendingR)
        return pendingR.error();
    auto filesR = store_.findNodes(projectId, NodeLabel::File);
    if (!filesR)
        return filesR.error();

    std::unordered_set<std::string> paths;
    for (const auto& node : filesR.value())
        paths.insert(node.key);

    ExtractionStats stats;
    std::set<std::string> dependencies;
    WriteBatch batch;
    for (const auto& pending : pendingR.value()) {
        std::optional<std::string> resolved;
        for (const auto& candidate : pending.candidates) {
            if (candidate != pending.source.key && paths.count(candidate)) {
                resolved = candidate;
                break;
            }
        }

        if (resolved) {
            json props = pending.properties;
            props.erase("dependency");
            props.erase("dependency_type");
            batch.upsertEdge(pending.relation, pending.source, {NodeLabel::File, *resolved},
                             std::move(props));
            if (pending.relation == Relation::Imports)
                ++stats.imports;
            else
                ++stats.references;
            continue;
        }

        // Unresolved references are dropped; unresolved imports become dependencies
        if (pending.relation != Relation::Imports)
            continue;
        auto name = pending.properties.value("dependency", std::string{});
        if (name.empty())
            name = topSegment(pending.target);
        if (name.empty())
            continue;
        model::DependencyRecord dep;
        dep.name = name;
        dep.type = pending.properties.value("dependency_type", std::string{"external"});
        auto depKey = model::keys::dependency(name);
        batch.upsertNode(NodeLabel::Dependency, depKey, dep.toProperties());
        batch.upsertEdge(Relation::DependsOn, pending.source, {NodeLabel::Dependency, depKey},
                         {{"module", pending.target}});
        dependencies.insert(depKey);
    }
    batch.clearPending();
    stats.dependencies = dependencies.size();

    auto applyR = store_.apply(projectId, batch);
    if (!applyR)
        return applyR.error();
    spdlog::debug("Resolved {} pending edges for {}: {} imports, {} references, {} dependencies",
                  pendingR.value().size(), projectId, stats.imports, stats.references,
                  stats.dependencies);
    return stats;
}

} // namespace cartograph::extraction

#pragma once

#include <cartograph/extraction/syntax_parser.h>
#include <cartograph/treesitter/grammar_loader.h>

#include <memory>
#include <string_view>

namespace cartograph::treesitter {

/**
 * @brief SyntaxParser backed by runtime-loaded tree-sitter grammars.
 *
 * Python gets a full walk (decorators, annotations, class kinds, enums, imports and
 * name references). Other grammars yield functions, classes, enums and Rust impl
 * blocks by node type, with the remaining fields left for inference.
 *
 * A fresh TSParser is created per call, so one instance serves all workers.
 */
class TreeSitterParser final : public extraction::SyntaxParser {
public:
    explicit TreeSitterParser(std::shared_ptr<GrammarLoader> loader = nullptr);

    bool supports(std::string_view language) const override;
    Result<extraction::Skeleton> parse(std::string_view contents,
                                       std::string_view language) override;

private:
    std::shared_ptr<GrammarLoader> loader_;
};

} // namespace cartograph::treesitter

//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Compiler.cpp
// Purpose: Template compilation pipeline driver.
//
//===----------------------------------------------------------------------===//

#include "frontends/tpl/Compiler.hpp"

#include "codegen/sql/SqlGenerator.hpp"
#include "frontends/tpl/AstPrinter.hpp"
#include "frontends/tpl/Lexer.hpp"
#include "frontends/tpl/MacroTable.hpp"
#include "frontends/tpl/Parser.hpp"
#include "frontends/tpl/Schema.hpp"

#include <iostream>

namespace reltpl::frontends::tpl
{

bool CompilerResult::succeeded() const
{
    return diagnostics.errorCount() == 0;
}

CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       reltpl::support::SourceManager &sm)
{
    CompilerResult result{};

    if (input.fileId.has_value())
        result.fileId = *input.fileId;
    else
        result.fileId = sm.addFile(std::string(input.path));
    sm.setText(result.fileId, std::string(input.source));

    // Phase 1: Sections
    auto sections = splitSections(input.source, result.fileId, result.diagnostics);
    if (!sections)
        return result;
    result.sections = std::move(*sections);

    // The side-effect table always exists at run time.
    Schema schema = Schema::fromScript(result.sections.initScript());
    schema.addTable("sys_Write", {"path", "content"});

    // Phase 2: Lexing and parsing
    Lexer lexer(result.sections.code, result.fileId, result.diagnostics);
    Parser parser(lexer, result.diagnostics);
    parser.setMaxNestingDepth(options.maxNestingDepth);
    auto root = parser.parseTemplate();
    if (!root || parser.hasError())
        return result;

    if (options.dumpAst)
    {
        AstPrinter printer;
        std::cerr << "=== AST after parsing ===\n"
                  << printer.dump(*root) << "=== End AST ===\n";
    }

    // Phase 3: Macro resolution
    auto macros = MacroTable::build(*root, result.diagnostics);
    if (!macros)
        return result;

    // Phase 4: SQL generation
    reltpl::codegen::sql::GeneratorOptions genOptions;
    genOptions.maxNestingDepth = options.maxNestingDepth;
    genOptions.maxFunctionArgs = options.maxFunctionArgs;
    genOptions.requireDeclaredTables = options.requireDeclaredTables;

    reltpl::codegen::sql::SqlGenerator generator(*macros, schema, result.diagnostics, genOptions);
    auto query = generator.generate(*root);
    if (!query)
        return result;
    result.query = std::move(*query);

    return result;
}

} // namespace reltpl::frontends::tpl

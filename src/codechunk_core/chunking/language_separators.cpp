#include "codechunk_core/chunking/language_separators.hpp"

#include <algorithm>
#include <cctype>

namespace codechunk_core {

std::string to_string(SplitterLanguage language) {
  switch (language) {
    case SplitterLanguage::Python:
      return "python";
    case SplitterLanguage::Java:
      return "java";
    case SplitterLanguage::JavaScript:
      return "javascript";
    case SplitterLanguage::TypeScript:
      return "typescript";
    case SplitterLanguage::Go:
      return "go";
    case SplitterLanguage::Cpp:
      return "cpp";
    case SplitterLanguage::Html:
      return "html";
    case SplitterLanguage::C:
      return "c";
    case SplitterLanguage::CSharp:
      return "c_sharp";
    case SplitterLanguage::Kotlin:
      return "kotlin";
    case SplitterLanguage::Php:
      return "php";
    case SplitterLanguage::Ruby:
      return "ruby";
    case SplitterLanguage::Rust:
      return "rust";
    case SplitterLanguage::Scala:
      return "scala";
    case SplitterLanguage::Swift:
      return "swift";
    case SplitterLanguage::Markdown:
      return "markdown";
    case SplitterLanguage::Rst:
      return "rst";
    case SplitterLanguage::Lua:
      return "lua";
    case SplitterLanguage::Perl:
      return "perl";
    case SplitterLanguage::Haskell:
      return "haskell";
    case SplitterLanguage::Elixir:
      return "elixir";
    case SplitterLanguage::Proto:
      return "proto";
    case SplitterLanguage::Sol:
      return "sol";
    case SplitterLanguage::Cobol:
      return "cobol";
    case SplitterLanguage::Latex:
      return "latex";
  }
  return "unknown";
}

const std::vector<SplitterLanguage>& all_splitter_languages() {
  static const std::vector<SplitterLanguage> languages = {
      SplitterLanguage::Python,  SplitterLanguage::Java,     SplitterLanguage::JavaScript,
      SplitterLanguage::TypeScript, SplitterLanguage::Go,   SplitterLanguage::Cpp,
      SplitterLanguage::Html,    SplitterLanguage::C,        SplitterLanguage::CSharp,
      SplitterLanguage::Kotlin,  SplitterLanguage::Php,      SplitterLanguage::Ruby,
      SplitterLanguage::Rust,    SplitterLanguage::Scala,    SplitterLanguage::Swift,
      SplitterLanguage::Markdown, SplitterLanguage::Rst,     SplitterLanguage::Lua,
      SplitterLanguage::Perl,    SplitterLanguage::Haskell,  SplitterLanguage::Elixir,
      SplitterLanguage::Proto,   SplitterLanguage::Sol,      SplitterLanguage::Cobol,
      SplitterLanguage::Latex};
  return languages;
}

std::optional<SplitterLanguage> splitter_language_from_string(const std::string& tag) {
  std::string lowered = tag;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);

  for (SplitterLanguage language : all_splitter_languages()) {
    if (to_string(language) == lowered) {
      return language;
    }
  }
  return std::nullopt;
}

std::vector<std::string> default_separators() {
  return {"\n\n", "\n", " ", ""};
}

std::vector<std::string> separators_for(SplitterLanguage language) {
  switch (language) {
    case SplitterLanguage::Cpp:
    case SplitterLanguage::C:
      return {"\nclass ", "\nvoid ", "\nint ",    "\nfloat ", "\ndouble ", "\nif ", "\nfor ",
              "\nwhile ", "\nswitch ", "\ncase ", "\n\n",     "\n",        " ",     ""};
    case SplitterLanguage::Go:
      return {"\nfunc ", "\nvar ",    "\nconst ", "\ntype ", "\nif ", "\nfor ",
              "\nswitch ", "\ncase ", "\n\n",     "\n",      " ",     ""};
    case SplitterLanguage::Java:
      return {"\nclass ", "\npublic ", "\nprotected ", "\nprivate ", "\nstatic ",
              "\nif ",    "\nfor ",    "\nwhile ",     "\nswitch ",  "\ncase ",
              "\n\n",     "\n",        " ",            ""};
    case SplitterLanguage::Kotlin:
      return {"\nclass ", "\npublic ", "\nprotected ", "\nprivate ", "\ninternal ",
              "\ncompanion ", "\nfun ", "\nval ",      "\nvar ",     "\nif ",
              "\nfor ",   "\nwhile ",  "\nwhen ",      "\ncase ",    "\nelse ",
              "\n\n",     "\n",        " ",            ""};
    case SplitterLanguage::JavaScript:
      return {"\nfunction ", "\nconst ", "\nlet ",     "\nvar ",  "\nclass ",
              "\nif ",       "\nfor ",   "\nwhile ",   "\nswitch ", "\ncase ",
              "\ndefault ",  "\n\n",     "\n",         " ",       ""};
    case SplitterLanguage::TypeScript:
      return {"\nenum ",  "\ninterface ", "\nnamespace ", "\ntype ",   "\nclass ",
              "\nfunction ", "\nconst ",  "\nlet ",       "\nvar ",    "\nif ",
              "\nfor ",   "\nwhile ",     "\nswitch ",    "\ncase ",   "\ndefault ",
              "\n\n",     "\n",           " ",            ""};
    case SplitterLanguage::Php:
      return {"\nfunction ", "\nclass ", "\nif ",   "\nforeach ", "\nwhile ", "\ndo ",
              "\nswitch ",   "\ncase ",  "\n\n",    "\n",         " ",        ""};
    case SplitterLanguage::Proto:
      return {"\nmessage ", "\nservice ", "\nenum ", "\noption ", "\nimport ",
              "\nsyntax ",  "\n\n",       "\n",      " ",         ""};
    case SplitterLanguage::Python:
      return {"\nclass ", "\ndef ", "\n\tdef ", "\n\n", "\n", " ", ""};
    case SplitterLanguage::Rst:
      return {"\n===", "\n---", "\n***", "\n\n.. ", "\n\n", "\n", " ", ""};
    case SplitterLanguage::Ruby:
      return {"\ndef ", "\nclass ", "\nif ",    "\nunless ", "\nwhile ", "\nfor ",
              "\ndo ",  "\nbegin ", "\nrescue ", "\n\n",     "\n",       " ",      ""};
    case SplitterLanguage::Elixir:
      return {"\ndef ",   "\ndefp ",     "\ndefmodule ", "\ndefprotocol ", "\ndefmacro ",
              "\ndefmacrop ", "\nif ",   "\nunless ",    "\nwhile ",       "\ncase ",
              "\ncond ",  "\nwith ",     "\nfor ",       "\ndo ",          "\n\n",
              "\n",       " ",           ""};
    case SplitterLanguage::Rust:
      return {"\nfn ",    "\nconst ", "\nlet ",   "\nif ", "\nwhile ", "\nfor ",
              "\nloop ",  "\nmatch ", "\n\n",     "\n",    " ",        ""};
    case SplitterLanguage::Scala:
      return {"\nclass ", "\nobject ", "\ndef ",   "\nval ",  "\nvar ", "\nif ",
              "\nfor ",   "\nwhile ",  "\nmatch ", "\ncase ", "\n\n",  "\n",
              " ",        ""};
    case SplitterLanguage::Swift:
      return {"\nfunc ", "\nclass ", "\nstruct ", "\nenum ", "\nif ", "\nfor ",
              "\nwhile ", "\ndo ",   "\nswitch ", "\ncase ", "\n\n", "\n",
              " ",        ""};
    case SplitterLanguage::Markdown:
      return {"\n# ",  "\n## ", "\n### ", "\n#### ", "\n##### ", "\n###### ",
              "```\n", "\n***", "\n---",  "\n___",   "\n\n",     "\n",
              " ",     ""};
    case SplitterLanguage::Latex:
      return {"\n\\chapter{",    "\n\\section{",        "\n\\subsection{",
              "\n\\subsubsection{", "\n\\begin{enumerate}", "\n\\begin{itemize}",
              "\n\\begin{description}", "\n\\begin{list}", "\n\\begin{quote}",
              "\n\\begin{quotation}", "\n\\begin{verse}", "\n\\begin{verbatim}",
              "\n\\begin{align}", "$$",                 "$",
              " ",               ""};
    case SplitterLanguage::Html:
      return {"<body", "<div", "<p",  "<br", "<li", "<h1", "<h2", "<h3", "<h4", "<h5",
              "<h6",   "<span", "<table", "<tr", "<td", "<ul", "<ol", "<header",
              "<footer", "<nav", "<head", "<style", "<script", "<meta", "<title", ""};
    case SplitterLanguage::CSharp:
      return {"\ninterface ", "\nenum ",     "\nimplements ", "\ndelegate ", "\nevent ",
              "\nclass ",     "\nabstract ", "\npublic ",     "\nprotected ", "\nprivate ",
              "\nstatic ",    "\nreturn ",   "\nif ",         "\ncontinue ", "\nfor ",
              "\nforeach ",   "\nwhile ",    "\nswitch ",     "\nbreak ",    "\ncase ",
              "\nelse ",      "\ntry ",      "\nthrow ",      "\nfinally ",  "\ncatch ",
              "\n\n",         "\n",          " ",             ""};
    case SplitterLanguage::Sol:
      return {"\npragma ",    "\nusing ",   "\ncontract ", "\ninterface ", "\nlibrary ",
              "\nconstructor ", "\ntype ",  "\nfunction ", "\nevent ",     "\nmodifier ",
              "\nerror ",     "\nstruct ",  "\nenum ",     "\nif ",        "\nfor ",
              "\nwhile ",     "\ndo while ", "\nassembly ", "\n\n",        "\n",
              " ",            ""};
    case SplitterLanguage::Cobol:
      return {"\nIDENTIFICATION DIVISION.", "\nENVIRONMENT DIVISION.", "\nDATA DIVISION.",
              "\nPROCEDURE DIVISION.",      "\nWORKING-STORAGE SECTION.", "\nLINKAGE SECTION.",
              "\nFILE SECTION.",            "\nINPUT-OUTPUT SECTION.", "\nOPEN ",
              "\nCLOSE ",                   "\nREAD ",                 "\nWRITE ",
              "\nIF ",                      "\nELSE ",                 "\nMOVE ",
              "\nPERFORM ",                 "\nUNTIL ",                "\nVARYING ",
              "\nACCEPT ",                  "\nDISPLAY ",              "\nSTOP RUN.",
              "\n",                         " ",                       ""};
    case SplitterLanguage::Lua:
      return {"\nlocal ", "\nfunction ", "\nif ", "\nfor ", "\nwhile ", "\nrepeat ",
              "\n\n",     "\n",          " ",     ""};
    case SplitterLanguage::Perl:
      return {"\nsub ", "\npackage ", "\nmy ", "\nif ", "\nunless ", "\nwhile ",
              "\nforeach ", "\nfor ", "\n\n",  "\n",    " ",         ""};
    case SplitterLanguage::Haskell:
      return {"\nmain :: ", "\nmain = ", "\nlet ",    "\nin ",     "\ndo ",
              "\nwhere ",   "\n:: ",     "\n= ",      "\ndata ",   "\nnewtype ",
              "\ntype ",    "\nmodule ", "\nimport ", "\nclass ",  "\ninstance ",
              "\ncase ",    "\n| ",      "\n\n",      "\n",        " ",
              ""};
  }
  return default_separators();
}

}  // namespace codechunk_core

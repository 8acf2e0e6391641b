// =================================================================
// src/Infiniloom/Types.cpp
// =================================================================
// Extension extraction and language detection.

#include "Infiniloom/Types.hpp"
#include <unordered_map>

namespace Infiniloom {

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const std::unordered_map<std::string, std::string>& languageTable() {
    static const std::unordered_map<std::string, std::string> table = {
        // Python
        {".py", "python"}, {".pyi", "python"}, {".pyx", "python"},

        // JavaScript/TypeScript
        {".js", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
        {".jsx", "jsx"}, {".ts", "typescript"}, {".tsx", "tsx"},

        {".rs", "rust"},
        {".go", "go"},

        // JVM
        {".java", "java"}, {".kt", "kotlin"}, {".kts", "kotlin"},
        {".scala", "scala"}, {".groovy", "groovy"},

        // C/C++
        {".c", "c"}, {".h", "c"},
        {".cpp", "cpp"}, {".hpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hxx", "cpp"},

        {".cs", "csharp"},
        {".rb", "ruby"}, {".rake", "ruby"}, {".gemspec", "ruby"},
        {".php", "php"},
        {".swift", "swift"},

        // Shell
        {".sh", "bash"}, {".bash", "bash"}, {".zsh", "zsh"}, {".fish", "fish"},

        // Web
        {".html", "html"}, {".htm", "html"}, {".css", "css"}, {".scss", "scss"},
        {".sass", "sass"}, {".less", "less"},

        // Data/Config
        {".json", "json"}, {".yaml", "yaml"}, {".yml", "yaml"}, {".toml", "toml"},
        {".xml", "xml"}, {".ini", "ini"},

        // Documentation
        {".md", "markdown"}, {".mdx", "mdx"}, {".rst", "rst"}, {".txt", "text"},

        {".zig", "zig"},
        {".lua", "lua"},
        {".sql", "sql"},
        {".ex", "elixir"}, {".exs", "elixir"}, {".erl", "erlang"},
        {".hs", "haskell"},
        {".ml", "ocaml"}, {".mli", "ocaml"},
        {".vue", "vue"}, {".svelte", "svelte"},
        {".dockerfile", "dockerfile"},
        {".tf", "terraform"}, {".tfvars", "terraform"}
    };
    return table;
}

} // namespace

std::vector<std::string> defaultExcludedExtensions() {
    return {
        ".exe", ".dll", ".so", ".dylib", ".a", ".o", ".obj",
        ".pyc", ".pyo", ".class", ".jar", ".war",
        ".zip", ".tar", ".gz", ".bz2", ".xz", ".7z", ".rar",
        ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".ico", ".webp", ".svg",
        ".mp3", ".mp4", ".avi", ".mov", ".wav", ".flac",
        ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx",
        ".woff", ".woff2", ".ttf", ".eot", ".otf",
        ".min.js", ".min.css", ".map",
        ".lock", ".sum"
    };
}

std::string getExtension(const std::string& filename) {
    if (endsWith(filename, ".min.js")) {
        return ".min.js";
    }
    if (endsWith(filename, ".min.css")) {
        return ".min.css";
    }

    size_t pos = filename.find_last_of("./");
    if (pos == std::string::npos || filename[pos] == '/') {
        return "";
    }
    return filename.substr(pos);
}

std::string detectLanguage(const std::string& filename) {
    std::string extension = getExtension(filename);
    if (extension.empty()) {
        return "";
    }

    // Minified bundles still carry their base language
    if (extension == ".min.js") {
        extension = ".js";
    } else if (extension == ".min.css") {
        extension = ".css";
    }

    const auto& table = languageTable();
    auto it = table.find(extension);
    return it != table.end() ? it->second : "";
}

} // namespace Infiniloom

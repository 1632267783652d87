/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <bufferpool.hpp>
#include <classifier.hpp>
#include <compiler.hpp>
#include <frontmatter.hpp>
#include <markdown.hpp>
#include <navigation.hpp>
#include <normalizer.hpp>
#include <templates.hpp>
#include <treewalker.hpp>
#include <utils.hpp>

#include <glib.h>
#include <tinyxml2.h>
#include <zip.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

#define CHECK_THROWS(expr)                                                                         \
    {                                                                                              \
        bool thrown = false;                                                                       \
        try {                                                                                      \
            expr;                                                                                  \
        } catch(const std::exception &) {                                                          \
            thrown = true;                                                                         \
        }                                                                                          \
        CHECK(thrown);                                                                             \
    }

namespace {

const char default_metadata[] = R"({"title": "Test book", "language": ["ru", "en"]})";

class TempDir {
public:
    TempDir() {
        GError *err = nullptr;
        gchar *p = g_dir_make_tmp("bookbinder-test-XXXXXX", &err);
        if(!p) {
            printf("Could not create temporary directory: %s\n", err->message);
            g_error_free(err);
            std::abort();
        }
        dir = p;
        g_free(p);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    const fs::path &path() const { return dir; }

private:
    fs::path dir;
};

void write_file(const fs::path &p, const std::string &contents) {
    fs::create_directories(p.parent_path());
    std::ofstream ofile(p, std::ios::binary);
    CHECK(!ofile.fail());
    ofile << contents;
}

struct Archive {
    explicit Archive(const fs::path &p) {
        int errcode = 0;
        z = zip_open(p.c_str(), ZIP_RDONLY, &errcode);
        CHECK(z);
    }
    ~Archive() { zip_discard(z); }

    bool has(const std::string &name) const { return zip_name_locate(z, name.c_str(), 0) >= 0; }

    std::string read(const std::string &name) const {
        zip_stat_t st;
        zip_stat_init(&st);
        CHECK(zip_stat(z, name.c_str(), 0, &st) == 0);
        zip_file_t *f = zip_fopen(z, name.c_str(), 0);
        CHECK(f);
        std::string contents(st.size, '\0');
        const zip_int64_t n = zip_fread(f, contents.data(), st.size);
        zip_fclose(f);
        CHECK(n == (zip_int64_t)st.size);
        return contents;
    }

    zip_int64_t num_entries() const { return zip_get_num_entries(z, 0); }

    std::string name_at(zip_uint64_t i) const { return zip_get_name(z, i, 0); }

    zip_t *z;
};

const tinyxml2::XMLElement *find_item(const tinyxml2::XMLDocument &opf, const char *href) {
    auto manifest = opf.FirstChildElement("package")->FirstChildElement("manifest");
    for(auto item = manifest->FirstChildElement("item"); item;
        item = item->NextSiblingElement("item")) {
        if(strcmp(item->Attribute("href"), href) == 0) {
            return item;
        }
    }
    return nullptr;
}

const tinyxml2::XMLElement *find_itemref(const tinyxml2::XMLDocument &opf, const char *idref) {
    auto spine = opf.FirstChildElement("package")->FirstChildElement("spine");
    for(auto ref = spine->FirstChildElement("itemref"); ref;
        ref = ref->NextSiblingElement("itemref")) {
        if(strcmp(ref->Attribute("idref"), idref) == 0) {
            return ref;
        }
    }
    return nullptr;
}

std::string properties_of(const tinyxml2::XMLElement *item) {
    const char *p = item->Attribute("properties");
    return p ? p : "";
}

int count_with_property(const tinyxml2::XMLDocument &opf, const char *property) {
    int count = 0;
    auto manifest = opf.FirstChildElement("package")->FirstChildElement("manifest");
    for(auto item = manifest->FirstChildElement("item"); item;
        item = item->NextSiblingElement("item")) {
        for(const auto &p : split_to_words(properties_of(item))) {
            if(p == property) {
                ++count;
            }
        }
    }
    return count;
}

void load_opf(const Archive &a, tinyxml2::XMLDocument &opf) {
    const auto text = a.read("OEBPS/content.opf");
    CHECK(opf.Parse(text.c_str(), text.size()) == tinyxml2::XML_SUCCESS);
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

void test_classify_hidden() {
    Config c;
    Classifier cl(c);
    CHECK(cl.classify(".", true) == EntryKind::Skip);
    CHECK(cl.classify(".draft", true) == EntryKind::SkipSubtree);
    CHECK(cl.classify("part/.git", true) == EntryKind::SkipSubtree);
    CHECK(cl.classify("part", true) == EntryKind::Skip);
    CHECK(cl.classify(".notes.md", false) == EntryKind::Skip);
    CHECK(cl.classify("part/~old.md", false) == EntryKind::Skip);
}

void test_classify_kinds() {
    Config c;
    Classifier cl(c);
    CHECK(cl.classify("metadata.json", false) == EntryKind::Skip);
    CHECK(cl.classify("part/metadata.json", false) == EntryKind::Media);
    CHECK(cl.classify("index.md", false) == EntryKind::Document);
    CHECK(cl.classify("part/Chapter.MARKDOWN", false) == EntryKind::Document);
    CHECK(cl.classify("images/cover.jpg", false) == EntryKind::Media);
    CHECK(cl.classify("README", false) == EntryKind::Media);
    c.markdown = {".txt"};
    CHECK(cl.classify("index.md", false) == EntryKind::Media);
    CHECK(cl.classify("index.txt", false) == EntryKind::Document);
}

void test_walk_order() {
    TempDir tmp;
    write_file(tmp.path() / "b.md", "b");
    write_file(tmp.path() / "a.md", "a");
    write_file(tmp.path() / "sub" / "c.md", "c");
    write_file(tmp.path() / ".hidden" / "x.md", "x");
    std::vector<std::string> visited;
    walk_tree(tmp.path(), [&visited](const std::string &relpath, bool is_directory) {
        visited.push_back(relpath);
        if(is_directory && relpath == ".hidden") {
            return WalkResult::SkipSubtree;
        }
        return WalkResult::Continue;
    });
    const std::vector<std::string> expected{".hidden", "a.md", "b.md", "sub", "sub/c.md"};
    CHECK(visited == expected);
}

void test_walk_unreadable_root() {
    int calls = 0;
    walk_tree("/this/path/does/not/exist", [&calls](const std::string &, bool) {
        ++calls;
        return WalkResult::Continue;
    });
    CHECK(calls == 0);
}

void test_normalize_collapse() {
    CHECK(normalize_markup("<p>a</p>\n\n\n<p>b</p>") == "<p>a</p>\n<p>b</p>");
    CHECK(normalize_markup("<p>a</p>\n<p>b</p>") == "<p>a</p>\n<p>b</p>");
    CHECK(normalize_markup("\n\n<p>a</p>\n\n") == "\n<p>a</p>\n");
    CHECK(normalize_markup("") == "");
}

void test_normalize_keeps_other_text() {
    // Not only newlines, so kept as is.
    CHECK(normalize_markup("<p>a</p>\n \n<p>b</p>") == "<p>a</p>\n \n<p>b</p>");
    CHECK(normalize_markup("text\n\nmore") == "text\n\nmore");
}

void test_normalize_shallow() {
    const std::string nested{"<div>\n\n\n<p>x</p></div>"};
    CHECK(normalize_markup(nested) == nested);
}

void test_normalize_idempotent() {
    const std::vector<std::string> inputs{
        "<p>a</p>\n\n\n<p>b</p>",
        "\n\n<h1>T</h1>\n\n<ul>\n<li>x</li>\n</ul>\n\n\n",
        "<div>\n\n<p>x &amp; y</p></div>\n\n<!-- note -->\n\n",
        markdown_to_xhtml("# Title\n\nSome *text* & more.\n\n> quote\n\n    code\n\n---\n"),
    };
    for(const auto &in : inputs) {
        const auto once = normalize_markup(in);
        CHECK(normalize_markup(once) == once);
    }
}

void test_normalize_html_input() {
    CHECK(normalize_markup("<p>line<br>next</p>") == "<p>line<br/>next</p>");
    CHECK(normalize_markup("<p>unclosed") == "<p>unclosed</p>");
    const auto nbsp = normalize_markup("<div>a&nbsp;b</div>\n\n<p>x</p>");
    CHECK(nbsp == "<div>a\xC2\xA0"
                  "b</div>\n<p>x</p>");
    CHECK(!contains(nbsp, "&amp;nbsp;"));
}

void test_normalize_task_list() {
    const auto html = markdown_to_xhtml("- [ ] todo\n- [x] done\n");
    const auto out = normalize_markup(html);
    CHECK(contains(out, "type=\"checkbox\""));
    CHECK(contains(out, "disabled=\""));
    CHECK(contains(out, "todo</li>"));
    CHECK(!contains(out, "</input>"));
    CHECK(normalize_markup(out) == out);
}

void test_markdown() {
    const auto html = markdown_to_xhtml("# Home\n\nHello *world*.\n");
    CHECK(contains(html, "<h1>Home</h1>"));
    CHECK(contains(html, "<p>Hello <em>world</em>.</p>"));
    CHECK(normalize_markup(html) == html);
}

void test_front_matter() {
    auto src = split_front_matter("---\n{\"title\": \"One\", \"level\": 2}\n---\nBody text\n", "t");
    CHECK(meta_string(src.meta, "title") == "One");
    CHECK(meta_int(src.meta, "level") == 2);
    CHECK(meta_string(src.meta, "subtitle").empty());
    CHECK(!meta_bool(src.meta, "hidden"));
    CHECK(src.body == "Body text\n");

    src = split_front_matter("No front matter.\n---\n", "t");
    CHECK(src.meta.empty());
    CHECK(src.body == "No front matter.\n---\n");

    src = split_front_matter("\xEF\xBB\xBF---\r\n\r\n---\r\nx", "t");
    CHECK(src.meta.empty());
    CHECK(src.body == "x");
}

void test_front_matter_errors() {
    CHECK_THROWS(split_front_matter("---\n{\"title\": \"x\"}\nbody\n", "t"));
    CHECK_THROWS(split_front_matter("---\n[1, 2]\n---\n", "t"));
    CHECK_THROWS(split_front_matter("---\n{broken\n---\n", "t"));
    auto src = split_front_matter("---\n{\"title\": 3, \"level\": \"x\"}\n---\n", "t");
    CHECK_THROWS(meta_string(src.meta, "title"));
    CHECK_THROWS(meta_int(src.meta, "level"));

    bool parse_error = false;
    try {
        split_front_matter("---\n{broken\n---\n", "t");
    } catch(const nlohmann::json::parse_error &) {
        parse_error = true;
    }
    CHECK(parse_error);

    src = split_front_matter("---\n{\"a\": 1000000000000, \"b\": -5000000000}\n---\n", "t");
    CHECK_THROWS(meta_int(src.meta, "a"));
    CHECK_THROWS(meta_int(src.meta, "b"));
    src = split_front_matter("---\n{\"a\": 2147483647, \"b\": -2147483648}\n---\n", "t");
    CHECK(meta_int(src.meta, "a") == 2147483647);
    CHECK(meta_int(src.meta, "b") == -2147483647 - 1);
}

void test_front_matter_values() {
    auto src = split_front_matter(
        "---\n{\"hidden\": \"yes\", \"properties\": \"cover-image, nav\"}\n---\n", "t");
    CHECK(meta_bool(src.meta, "hidden"));
    const std::vector<std::string> expected{"cover-image", "nav"};
    CHECK(meta_quick_list(src.meta, "properties") == expected);
    src = split_front_matter("---\n{\"properties\": [\"cover-image\", \"nav\"]}\n---\n", "t");
    CHECK(meta_quick_list(src.meta, "properties") == expected);
}

void test_navigation_builder() {
    NavigationBuilder nb;
    CHECK(nb.needs_fallback());
    nb.append(NavigationItem{"One", "", 0, "one.xhtml", ContentType::Primary});
    nb.append(NavigationItem{"Two", "Sub", 1, "two.xhtml", ContentType::Auxiliary});
    nb.declare_nav_document();
    CHECK(nb.toc_state() == TocState::Satisfied);
    CHECK(!nb.needs_fallback());
    const auto j = nb.to_json();
    CHECK(j.size() == 2);
    CHECK(j[0]["title"] == "One");
    CHECK(j[1]["subtitle"] == "Sub");
    CHECK(j[1]["level"] == 1);
    CHECK(j[1]["type"] == "auxiliary");
    CHECK(j[1]["href"] == "two.xhtml");
    nb.freeze();
    CHECK_THROWS(nb.append(NavigationItem{"Three", "", 0, "three.xhtml", ContentType::Primary}));
    CHECK(nb.items().size() == 2);
}

void test_buffer_pool() {
    BufferPool pool(1);
    {
        auto a = pool.checkout();
        a->append("leftover");
        auto b = pool.checkout();
        CHECK(b->empty());
    }
    CHECK(pool.num_idle() == 1);
    auto c = pool.checkout();
    CHECK(c->empty());
    CHECK(pool.num_idle() == 0);
}

void test_relative_stylesheet() {
    CHECK(relative_to_document("style.css", "index.md") == "style.css");
    CHECK(relative_to_document("style.css", "part/one.md") == "../style.css");
    CHECK(relative_to_document("css/book.css", "css/x.md") == "book.css");
    CHECK_THROWS(relative_to_document("/abs/style.css", "part/one.md"));
}

void test_templates() {
    TemplateSet t;
    CHECK(t.has("page"));
    CHECK(t.has("nav"));
    CHECK(t.has("toc"));
    nlohmann::json data{{"lang", "en"}, {"title", "A & B"}, {"content", "<p>x</p>"}};
    const auto page = t.render("page", data);
    CHECK(contains(page, "<title>A &amp; B</title>"));
    CHECK(contains(page, "<p>x</p>"));
    CHECK(!contains(page, "stylesheet"));
    data["global_css"] = "../style.css";
    CHECK(contains(t.render("page", data), "href=\"../style.css\""));
    CHECK_THROWS(t.render("missing", data));
}

void test_compile_fallback_toc() {
    TempDir tmp;
    const auto src = tmp.path() / "book";
    write_file(src / "metadata.json", default_metadata);
    write_file(src / "style.css", "body { margin: 0; }\n");
    write_file(src / "index.md", "---\n{\"title\": \"Home\"}\n---\n# Home\n\nHello *world*.\n");
    write_file(src / "part" / "one.md",
               "---\n{\"subtitle\": \"Sub & more\", \"level\": 1}\n---\nChapter text.\n");
    write_file(src / "part" / "two.md", "---\n{\"lang\": \"en\", \"hidden\": true}\n---\nx\n");
    write_file(src / "cover.jpg", "not really a jpeg");
    write_file(src / "photo.jpg", "also not a jpeg");
    write_file(src / ".draft" / "notes.md", "draft");
    write_file(src / "~backup.md", "backup");
    write_file(src / ".hidden.md", "hidden");

    Config config;
    config.covers = {"*.jpg"};
    const auto ofile = tmp.path() / "out.epub";
    const auto cwd = fs::current_path();
    const auto summary = compile(src, ofile, config);
    CHECK(fs::current_path() == cwd);

    CHECK(summary.generated_toc);
    CHECK(summary.cover_file == "cover.jpg");
    CHECK(summary.navigation.size() == 3);
    const auto &home = summary.navigation[0];
    CHECK(home.title == "Home");
    CHECK(home.level == 0);
    CHECK(home.filename == "index.xhtml");
    CHECK(home.ct == ContentType::Primary);
    const auto &one = summary.navigation[1];
    CHECK(one.title == untitled_title);
    CHECK(one.subtitle == "Sub & more");
    CHECK(one.level == 1);
    CHECK(one.filename == "part/one.xhtml");
    CHECK(summary.navigation[2].filename == "part/two.xhtml");
    CHECK(summary.navigation[2].ct == ContentType::Auxiliary);

    Archive a(ofile);
    CHECK(a.name_at(0) == "mimetype");
    CHECK(a.read("mimetype") == "application/epub+zip");
    CHECK(a.has("META-INF/container.xml"));
    CHECK(a.has("OEBPS/index.xhtml"));
    CHECK(a.has("OEBPS/part/one.xhtml"));
    CHECK(a.has("OEBPS/style.css"));
    CHECK(a.has("OEBPS/_toc.xhtml"));
    CHECK(!a.has("OEBPS/metadata.json"));
    for(zip_int64_t i = 0; i < a.num_entries(); ++i) {
        const auto name = a.name_at(i);
        CHECK(!contains(name, "draft"));
        CHECK(!contains(name, "backup"));
        CHECK(!contains(name, "hidden"));
    }

    const auto index = a.read("OEBPS/index.xhtml");
    CHECK(index.starts_with("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"));
    CHECK(contains(index, "<p>Hello <em>world</em>.</p>"));
    CHECK(contains(index, "href=\"style.css\""));
    CHECK(contains(index, "xml:lang=\"ru\""));
    const auto part_one = a.read("OEBPS/part/one.xhtml");
    CHECK(contains(part_one, "href=\"../style.css\""));
    CHECK(contains(part_one, "<title>* * *</title>"));
    CHECK(contains(a.read("OEBPS/part/two.xhtml"), "xml:lang=\"en\""));

    const auto toc = a.read("OEBPS/_toc.xhtml");
    const auto home_pos = toc.find("<a href=\"index.xhtml\">Home</a>");
    const auto one_pos = toc.find("<a href=\"part/one.xhtml\">* * *</a>");
    const auto two_pos = toc.find("<a href=\"part/two.xhtml\">* * *</a>");
    CHECK(home_pos != std::string::npos);
    CHECK(one_pos != std::string::npos);
    CHECK(two_pos != std::string::npos);
    CHECK(home_pos < one_pos);
    CHECK(one_pos < two_pos);
    CHECK(contains(toc, "Sub &amp; more"));
    CHECK(contains(toc, "toc-level-1"));
    CHECK(contains(toc, "Оглавление"));
    CHECK(contains(toc, "href=\"style.css\""));

    tinyxml2::XMLDocument opf;
    load_opf(a, opf);
    CHECK(count_with_property(opf, "cover-image") == 1);
    CHECK(properties_of(find_item(opf, "cover.jpg")) == "cover-image");
    CHECK(properties_of(find_item(opf, "photo.jpg")).empty());
    CHECK(count_with_property(opf, "nav") == 1);
    auto toc_item = find_item(opf, "_toc.xhtml");
    CHECK(properties_of(toc_item) == "nav");
    auto toc_ref = find_itemref(opf, toc_item->Attribute("id"));
    CHECK(toc_ref);
    CHECK(toc_ref->Attribute("linear", "no"));
    auto index_ref = find_itemref(opf, find_item(opf, "index.xhtml")->Attribute("id"));
    CHECK(index_ref);
    CHECK(!index_ref->Attribute("linear"));
    CHECK(!find_itemref(opf, find_item(opf, "photo.jpg")->Attribute("id")));
    CHECK(strcmp(find_item(opf, "cover.jpg")->Attribute("media-type"), "image/jpeg") == 0);
}

void test_compile_nav_document() {
    TempDir tmp;
    const auto src = tmp.path() / "book";
    write_file(src / "metadata.json", default_metadata);
    write_file(src / "chapter.md",
               "---\n{\"title\": \"Contents\", \"properties\": [\"cover-image\", \"nav\"]}\n---\n"
               "1. [Chapter](chapter.xhtml)\n");
    write_file(src / "cover.png", "png");
    write_file(src / "images" / "cover.png", "png");

    const auto ofile = tmp.path() / "out.epub";
    const auto summary = compile(src, ofile, Config{});
    CHECK(!summary.generated_toc);
    CHECK(summary.cover_file == "cover.png");
    CHECK(summary.navigation.size() == 1);
    CHECK(summary.navigation[0].filename == "chapter.xhtml");

    Archive a(ofile);
    CHECK(!a.has("OEBPS/_toc.xhtml"));
    CHECK(contains(a.read("OEBPS/chapter.xhtml"), "<nav epub:type=\"toc\""));
    CHECK(!a.has("OEBPS/style.css"));
    CHECK(!contains(a.read("OEBPS/chapter.xhtml"), "stylesheet"));

    tinyxml2::XMLDocument opf;
    load_opf(a, opf);
    // The writer got ["cover", "nav"], cover pages go to the guide.
    CHECK(properties_of(find_item(opf, "chapter.xhtml")) == "nav");
    auto guide = opf.FirstChildElement("package")->FirstChildElement("guide");
    CHECK(guide);
    auto reference = guide->FirstChildElement("reference");
    CHECK(reference);
    CHECK(reference->Attribute("href", "chapter.xhtml"));
    CHECK(count_with_property(opf, "cover-image") == 1);
    CHECK(properties_of(find_item(opf, "cover.png")) == "cover-image");
    CHECK(properties_of(find_item(opf, "images/cover.png")).empty());
}

void test_compile_template_override() {
    TempDir tmp;
    const auto src = tmp.path() / "book";
    write_file(src / "metadata.json", default_metadata);
    write_file(src / ".templates" / "page.xhtml", "PAGE {{ escape(title) }}");
    write_file(src / "index.md", "---\n{\"title\": \"Home\"}\n---\ntext\n");

    const auto ofile = tmp.path() / "out.epub";
    compile(src, ofile, Config{});
    Archive a(ofile);
    CHECK(a.read("OEBPS/index.xhtml") == "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\nPAGE Home");
    CHECK(!a.has("OEBPS/.templates/page.xhtml"));
}

void test_compile_raw_html() {
    TempDir tmp;
    const auto src = tmp.path() / "book";
    write_file(src / "metadata.json", default_metadata);
    write_file(src / "a.md",
               "line<br>next\n\n- [ ] todo\n\n<div>\n\nunclosed &nbsp; div\n");
    const auto ofile = tmp.path() / "out.epub";
    compile(src, ofile, Config{});
    Archive a(ofile);
    const auto page = a.read("OEBPS/a.xhtml");
    CHECK(contains(page, "line<br/>"));
    CHECK(contains(page, "disabled=\""));
    CHECK(contains(page, "</div>"));
    CHECK(!contains(page, "&amp;nbsp;"));
    tinyxml2::XMLDocument xhtml;
    CHECK(xhtml.Parse(page.c_str(), page.size()) == tinyxml2::XML_SUCCESS);
}

void test_compile_spaces_in_names() {
    TempDir tmp;
    const auto src = tmp.path() / "book";
    write_file(src / "metadata.json", default_metadata);
    write_file(src / "style.css", "p {}\n");
    write_file(src / "front page.md",
               "---\n{\"title\": \"Front\", \"properties\": \"cover-image\"}\n---\nx\n");
    write_file(src / "part one" / "ch 1.md", "---\n{\"title\": \"One\"}\n---\ny\n");
    const auto ofile = tmp.path() / "out.epub";
    const auto summary = compile(src, ofile, Config{});
    CHECK(summary.navigation[1].filename == "part one/ch 1.xhtml");

    Archive a(ofile);
    CHECK(a.has("OEBPS/part one/ch 1.xhtml"));
    const auto toc = a.read("OEBPS/_toc.xhtml");
    CHECK(contains(toc, "<a href=\"part%20one/ch%201.xhtml\">One</a>"));
    CHECK(contains(toc, "<a href=\"front%20page.xhtml\">Front</a>"));

    tinyxml2::XMLDocument opf;
    load_opf(a, opf);
    CHECK(find_item(opf, "part%20one/ch%201.xhtml"));
    CHECK(find_item(opf, "front%20page.xhtml"));
    CHECK(!find_item(opf, "front page.xhtml"));
    auto reference =
        opf.FirstChildElement("package")->FirstChildElement("guide")->FirstChildElement("reference");
    CHECK(reference->Attribute("href", "front%20page.xhtml"));
}

void test_compile_errors() {
    const auto cwd = fs::current_path();
    {
        TempDir tmp;
        const auto src = tmp.path() / "book";
        write_file(src / "index.md", "text\n");
        CHECK_THROWS(compile(src, tmp.path() / "out.epub", Config{}));
        CHECK(fs::current_path() == cwd);
    }
    {
        TempDir tmp;
        const auto src = tmp.path() / "book";
        write_file(src / "metadata.json", R"({"title": "x", "language": []})");
        CHECK_THROWS(compile(src, tmp.path() / "out.epub", Config{}));
    }
    {
        TempDir tmp;
        const auto src = tmp.path() / "book";
        write_file(src / "metadata.json", default_metadata);
        write_file(src / "a.md", "fine\n");
        write_file(src / "b.md", "---\n{\"title\": \"never closed\"}\n");
        write_file(src / "c.md", "never reached\n");
        CHECK_THROWS(compile(src, tmp.path() / "out.epub", Config{}));
        CHECK(fs::current_path() == cwd);
    }
    CHECK_THROWS(compile("/this/path/does/not/exist", "out.epub", Config{}));
    CHECK(fs::current_path() == cwd);
}

void test_config_file() {
    TempDir tmp;
    write_file(tmp.path() / "config.json",
               R"({"markdown": [".txt"], "covers": "front.*", "toc_title": "Contents"})");
    const auto c = load_config_json(tmp.path() / "config.json");
    CHECK(c.markdown == std::vector<std::string>{".txt"});
    CHECK(c.covers == std::vector<std::string>{"front.*"});
    CHECK(c.toc_title == "Contents");
    CHECK(c.metadata == "metadata.json");
    write_file(tmp.path() / "bad.json", R"({"metadata": 5})");
    CHECK_THROWS(load_config_json(tmp.path() / "bad.json"));
}

void test_publication_metadata() {
    TempDir tmp;
    write_file(tmp.path() / "m.json",
               R"({"title": "T", "language": "fi", "creator": ["A", "B"], "identifier": "isbn:1"})");
    const auto m = load_publication_json(tmp.path() / "m.json");
    CHECK(m.language() == "fi");
    CHECK(m.creators.size() == 2);
    CHECK(m.identifier == "isbn:1");
    write_file(tmp.path() / "n.json", R"({"title": "T", "language": ["en"]})");
    CHECK(load_publication_json(tmp.path() / "n.json").identifier.starts_with("urn:uuid:"));
    write_file(tmp.path() / "o.json", R"({"language": ["en"]})");
    CHECK_THROWS(load_publication_json(tmp.path() / "o.json"));
}

void test_writer() {
    TempDir tmp;
    const auto ofile = tmp.path() / "w.epub";
    {
        EpubWriter w(ofile);
        w.metadata.title = "T";
        w.metadata.identifier = "id";
        w.metadata.languages = {"en"};
        w.add("a.xhtml", ContentType::Primary, "<html/>");
        CHECK_THROWS(w.add("a.xhtml", ContentType::Primary, "<html/>"));
        CHECK_THROWS(w.add("../escape.xhtml", ContentType::Primary, "<html/>"));
        CHECK_THROWS(w.add_file(tmp.path() / "missing.png", "missing.png", ContentType::Media));
        w.close();
        CHECK(!w.is_open());
        CHECK_THROWS(w.add("b.xhtml", ContentType::Primary, "<html/>"));
        CHECK_THROWS(w.close());
    }
    Archive a(ofile);
    CHECK(a.read("OEBPS/a.xhtml") == "<html/>");
    tinyxml2::XMLDocument opf;
    load_opf(a, opf);
    auto package = opf.FirstChildElement("package");
    CHECK(package->Attribute("version", "3.0"));
    auto md = package->FirstChildElement("metadata");
    CHECK(strcmp(md->FirstChildElement("dc:title")->GetText(), "T") == 0);
    CHECK(strcmp(md->FirstChildElement("dc:language")->GetText(), "en") == 0);
    CHECK(media_type_for("x.XHTML") == "application/xhtml+xml");
    CHECK(media_type_for("font.woff2") == "font/woff2");
    CHECK(media_type_for("data.bin") == "application/octet-stream");
}

void test_utils() {
    CHECK(matches_any("Cover.JPG", {"cover.*"}));
    CHECK(!matches_any("photo.jpg", {"cover.*"}));
    CHECK(base_name("a/b/c.md") == "c.md");
    CHECK(base_name("c.md") == "c.md");
    const std::vector<std::string> words{"a", "b", "c"};
    CHECK(split_to_words(" a,b  c\n") == words);
    CHECK(xml_escape("<&>") == "&lt;&amp;&gt;");
    CHECK(uri_escape("part one/ch 1.xhtml") == "part%20one/ch%201.xhtml");
    CHECK(uri_escape("plain/name.xhtml") == "plain/name.xhtml");
    CHECK(current_timestamp().size() == 20);
}

int main(int, char **) {
    printf("Running unit tests.\n");
    test_classify_hidden();
    test_classify_kinds();
    test_walk_order();
    test_walk_unreadable_root();
    test_normalize_collapse();
    test_normalize_keeps_other_text();
    test_normalize_shallow();
    test_normalize_idempotent();
    test_normalize_html_input();
    test_normalize_task_list();
    test_markdown();
    test_front_matter();
    test_front_matter_errors();
    test_front_matter_values();
    test_navigation_builder();
    test_buffer_pool();
    test_relative_stylesheet();
    test_templates();
    test_utils();
    test_config_file();
    test_publication_metadata();
    test_writer();
    printf("Running compile tests.\n");
    test_compile_fallback_toc();
    test_compile_nav_document();
    test_compile_template_override();
    test_compile_raw_html();
    test_compile_spaces_in_names();
    test_compile_errors();
    printf("All tests passed.\n");
    return 0;
}

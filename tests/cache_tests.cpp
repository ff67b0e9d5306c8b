#include "test_support.hpp"

#include <quantum/runtime/ast_cache.hpp>

using quantum::core::ParseError;
using quantum::core::ServiceContainer;
using quantum::parser::Parser;
using quantum::runtime::AstCache;
using quantum::runtime::ComponentRuntime;
using quantum::runtime::RuntimeOptions;
using quantum::runtime::Value;
using quantum::testing::TempDir;
using quantum::testing::throws;

namespace {

AstCache counting_cache(const Parser& parser, int& parses, std::size_t max_items = 128, bool enabled = true) {
    return AstCache(
        [&parser, &parses](std::string_view source, const std::filesystem::path& origin) {
            ++parses;
            return parser.parse(source, origin);
        },
        max_items, std::chrono::seconds(300), enabled);
}

void sha1_digests() {
    assert(AstCache::sha1_hex("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
    assert(AstCache::sha1_hex("") == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

void unchanged_files_are_parsed_once() {
    TempDir dir;
    auto path = dir.write("card.q", "<div>{title}</div>");
    Parser parser;
    int parses = 0;
    auto cache = counting_cache(parser, parses);

    auto first = cache.load(path);
    auto second = cache.load(path);
    assert(parses == 1);
    assert(first.get() == second.get());

    auto stats = cache.stats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.parses == 1);
    assert(stats.entries == 1);

    // the same file through a different spelling of its path
    auto third = cache.load(dir.path() / "." / "card.q");
    assert(third.get() == first.get());
    assert(parses == 1);
}

void changed_content_is_reparsed() {
    TempDir dir;
    auto path = dir.write("card.q", "<div>{title}</div>");
    Parser parser;
    int parses = 0;
    auto cache = counting_cache(parser, parses);

    auto before = cache.load(path);
    dir.write("card.q", "<section>{title}</section>");
    auto after = cache.load(path);

    assert(parses == 2);
    assert(before.get() != after.get());
    assert(cache.stats().invalidations == 1);
    assert(after->body()[0]->kind == quantum::ast::NodeKind::Html);
    assert(quantum::ast::node_cast<quantum::ast::HtmlNode>(*after->body()[0]).tag == "section");

    cache.invalidate(path);
    cache.load(path);
    assert(parses == 3);
}

void disabled_cache_always_parses() {
    TempDir dir;
    auto path = dir.write("card.q", "<div/>");
    Parser parser;
    int parses = 0;
    auto cache = counting_cache(parser, parses, 128, false);

    auto first = cache.load(path);
    auto second = cache.load(path);
    assert(parses == 2);
    assert(first.get() != second.get());
    assert(cache.stats().entries == 0);

    cache.set_enabled(true);
    cache.load(path);
    cache.load(path);
    assert(parses == 3);

    // switching off drops what was cached
    cache.set_enabled(false);
    assert(cache.stats().entries == 0);
}

void least_recently_used_entries_are_evicted() {
    TempDir dir;
    auto a = dir.write("a.q", "<p>a</p>");
    auto b = dir.write("b.q", "<p>b</p>");
    auto c = dir.write("c.q", "<p>c</p>");
    Parser parser;
    int parses = 0;
    auto cache = counting_cache(parser, parses, 2);

    cache.load(a);
    cache.load(b);
    cache.load(a); // a is now the most recent
    cache.load(c); // evicts b
    assert(cache.stats().evictions == 1);
    assert(cache.stats().entries == 2);
    assert(parses == 3);

    cache.load(a);
    assert(parses == 3);
    cache.load(b);
    assert(parses == 4);
}

void failures_are_not_cached() {
    TempDir dir;
    auto path = dir.write("broken.q", "<div><p></div>");
    Parser parser;
    int parses = 0;
    auto cache = counting_cache(parser, parses);

    assert(throws<ParseError>([&] { cache.load(path); }));
    assert(throws<ParseError>([&] { cache.load(path); }));
    assert(parses == 2);
    assert(cache.stats().entries == 0);

    assert(throws<ParseError>([&] { cache.load(dir.path() / "missing.q"); }));
}

void cached_and_uncached_renders_match() {
    TempDir dir;
    auto path = dir.write("list.q", R"(<q:component name="List">
  <q:param name="items" type="array" default="[]"/>
  <ul><q:loop type="array" var="item" items="{items}"><li>{upper(item)}</li></q:loop></ul>
</q:component>)");

    ServiceContainer services;
    ComponentRuntime cached(services);
    RuntimeOptions options;
    options.cache.ast_enabled = false;
    options.cache.expression_enabled = false;
    ComponentRuntime uncached(services, options);

    Value params{{"items", Value::array({"a", "b"})}};
    auto expected = std::string("<ul><li>A</li><li>B</li></ul>");
    for (int i = 0; i < 3; ++i) {
        assert(cached.render_file(path, params).html() == expected);
        assert(uncached.render_file(path, params).html() == expected);
    }

    assert(cached.ast_cache().stats().parses == 1);
    assert(uncached.ast_cache().stats().parses == 3);
    assert(cached.expression_cache().stats().hits > 0);
    assert(uncached.expression_cache().stats().entries == 0);

    cached.set_cache_enabled(false);
    assert(cached.render_file(path, params).html() == expected);
    assert(cached.ast_cache().stats().parses == 2);
}

} // namespace

int main()
{
    sha1_digests();
    unchanged_files_are_parsed_once();
    changed_content_is_reparsed();
    disabled_cache_always_parses();
    least_recently_used_entries_are_evicted();
    failures_are_not_cached();
    cached_and_uncached_renders_match();
    return 0;
}

#include <QtTest/QtTest>

#include <limits>

#include <nlohmann/json.hpp>

#include "template/environment.hpp"

class TemplateRenderTests : public QObject
{
    Q_OBJECT
private slots:
    void testArithmetic();
    void testFloatDisplay();
    void testComparisonsAndLogic();
    void testVariablesAndAttributes();
    void testUndefinedValues();
    void testStringFilters();
    void testNumberFilters();
    void testSequenceFilters();
    void testTests();
    void testIntegerLimits();
    void testIfElifElse();
    void testForLoops();
    void testLoopVariable();
    void testSetScoping();
    void testWhitespaceControl();
    void testTrimBlocks();
    void testRawAndComments();
    void testCompiledTemplateIsReusable();
};

namespace {

QString render(const std::string &source,
               const nlohmann::json &context = nlohmann::json::object())
{
    ptatemp::templating::Environment env;
    return QString::fromStdString(env.renderString(source, context));
}

} // namespace

void TemplateRenderTests::testArithmetic()
{
    QCOMPARE(render("{{ 1 + 2 * 3 }}"), QStringLiteral("7"));
    QCOMPARE(render("{{ (1 + 2) * 3 }}"), QStringLiteral("9"));
    QCOMPARE(render("{{ 7 // 2 }} {{ -7 // 2 }}"), QStringLiteral("3 -4"));
    QCOMPARE(render("{{ 7 % 3 }} {{ -7 % 3 }}"), QStringLiteral("1 2"));
    QCOMPARE(render("{{ 2 ** 10 }} {{ -2 ** 2 }}"), QStringLiteral("1024 -4"));
    QCOMPARE(render("{{ 2 ** 3 ** 2 }}"), QStringLiteral("512"));
    QCOMPARE(render("{{ 'ab' ~ 1 ~ none }}"), QStringLiteral("ab1none"));
    QCOMPARE(render("{{ 'ab' * 3 }}"), QStringLiteral("ababab"));
    QCOMPARE(render("{{ [1, 2] + [3] }}"), QStringLiteral("[1, 2, 3]"));
    QCOMPARE(render("{{ 'foo' 'bar' }}"), QStringLiteral("foobar"));
    QCOMPARE(render("{{ balance / 100 }}", {{"balance", -123456}}), QStringLiteral("-1234.56"));
}

void TemplateRenderTests::testFloatDisplay()
{
    QCOMPARE(render("{{ 10 / 2 }}"), QStringLiteral("5.0"));
    QCOMPARE(render("{{ 12.5 }}"), QStringLiteral("12.5"));
    QCOMPARE(render("{{ 0.1 + 0.2 }}"), QStringLiteral("0.30000000000000004"));
    QCOMPARE(render("{{ 1 / 3 }}"), QStringLiteral("0.3333333333333333"));
    QCOMPARE(render("{{ 1.5 + 1 }}"), QStringLiteral("2.5"));
    QCOMPARE(render("{{ 7.0 // 2 }}"), QStringLiteral("3.0"));
}

void TemplateRenderTests::testComparisonsAndLogic()
{
    QCOMPARE(render("{{ 1 < 2 }} {{ 2 <= 1 }} {{ 1 == 1.0 }} {{ 'a' != 'b' }}"),
             QStringLiteral("true false true true"));
    QCOMPARE(render("{{ 'b' in ['a', 'b'] }} {{ 'x' not in 'abc' }} {{ 'k' in {'k': 1} }}"),
             QStringLiteral("true true true"));
    QCOMPARE(render("{{ 0 or 'fallback' }} {{ 1 and 'both' }} {{ not 0 }}"),
             QStringLiteral("fallback both true"));
    QCOMPARE(render("{{ 'pos' if x > 0 else 'neg' }}", {{"x", -3}}), QStringLiteral("neg"));
    QCOMPARE(render("[{{ 'shown' if false }}]"), QStringLiteral("[]"));
}

void TemplateRenderTests::testVariablesAndAttributes()
{
    const nlohmann::json context = {
        {"acct", {{"name", "assets:checking"}, {"tags", {"a", "b", "c"}}}},
        {"amount", 42},
    };
    QCOMPARE(render("{{ acct.name }}|{{ acct['name'] }}", context),
             QStringLiteral("assets:checking|assets:checking"));
    QCOMPARE(render("{{ acct.tags[-1] }}{{ acct.tags.0 }}", context), QStringLiteral("ca"));
    QCOMPARE(render("{{ acct.tags }}", context), QStringLiteral("[\"a\", \"b\", \"c\"]"));
    QCOMPARE(render("{{ {'k': 1, 'j': [true, none]} }}"),
             QStringLiteral("{\"j\": [true, none], \"k\": 1}"));
    QCOMPARE(render("{{ amount }}", context), QStringLiteral("42"));
}

void TemplateRenderTests::testUndefinedValues()
{
    QCOMPARE(render("[{{ missing }}]"), QStringLiteral("[]"));
    QCOMPARE(render("{% if missing %}yes{% else %}no{% endif %}"), QStringLiteral("no"));
    QCOMPARE(render("{% for x in missing %}a{% endfor %}"), QString());
    QCOMPARE(render("[{{ obj.missing }}]", {{"obj", nlohmann::json::object()}}),
             QStringLiteral("[]"));
    QCOMPARE(render("{{ missing | default('n/a') }} {{ '' | d('empty', true) }}"),
             QStringLiteral("n/a empty"));
    QCOMPARE(render("{{ missing | length }}"), QStringLiteral("0"));
}

void TemplateRenderTests::testStringFilters()
{
    QCOMPARE(render("{{ 'hello world' | title }}"), QStringLiteral("Hello World"));
    QCOMPARE(render("{{ 'hELLO' | capitalize }}"), QStringLiteral("Hello"));
    QCOMPARE(render("{{ 'Food' | upper }} {{ 'Food' | lower }}"), QStringLiteral("FOOD food"));
    QCOMPARE(render("[{{ '  x  ' | trim }}] [{{ '--x--' | trim('-') }}]"),
             QStringLiteral("[x] [x]"));
    QCOMPARE(render("{{ 'a-b-c' | replace('-', ':') }} {{ 'a-b-c' | replace('-', '', 1) }}"),
             QStringLiteral("a:b:c ab-c"));
    QCOMPARE(render("{{ 42 | string ~ '!' }}"), QStringLiteral("42!"));
    QCOMPARE(render("{{ 'héllo' | length }} {{ 'abc' | reverse }}"), QStringLiteral("5 cba"));
    QCOMPARE(render("{{ 'héllo wörld' | title }}"), QStringLiteral("Héllo Wörld"));
    QCOMPARE(render("{{ 'épicerie' | upper }} {{ 'ÉPICERIE' | lower }} {{ 'éPICERIE' | capitalize }}"),
             QStringLiteral("ÉPICERIE épicerie Épicerie"));
}

void TemplateRenderTests::testNumberFilters()
{
    QCOMPARE(render("{{ x | abs }} {{ -2.5 | abs }}", {{"x", -3}}), QStringLiteral("3 -2.5"));
    QCOMPARE(render("{{ (-2.5) | abs }}"), QStringLiteral("2.5"));
    QCOMPARE(render("{{ 2.5 | round }} {{ 3.14159 | round(2) }}"), QStringLiteral("3.0 3.14"));
    QCOMPARE(render("{{ 2.1 | round(method='ceil') }} {{ 2.9 | round(0, 'floor') }}"),
             QStringLiteral("3.0 2.0"));
    QCOMPARE(render("{{ '5' | int + 1 }} {{ 'x' | int(7) }} {{ 3.9 | int }}"),
             QStringLiteral("6 7 3"));
    QCOMPARE(render("{{ '2.5' | float }} {{ 'x' | float }}"), QStringLiteral("2.5 0.0"));
}

void TemplateRenderTests::testSequenceFilters()
{
    QCOMPARE(render("{{ [3, 1, 2] | sort | join(',') }}"), QStringLiteral("1,2,3"));
    QCOMPARE(render("{{ [3, 1, 2] | sort(true) | join }}"), QStringLiteral("321"));
    QCOMPARE(render("{{ [1, 2, 3] | sum }} {{ [1, 2] | sum(start=10) }}"),
             QStringLiteral("6 13"));
    QCOMPARE(render("{{ [4, 9, 2] | max }} {{ [4, 9, 2] | min }}"), QStringLiteral("9 2"));
    QCOMPARE(render("{{ [1, 2] | first }} {{ [1, 2] | last }} {{ [1, 2] | count }}"),
             QStringLiteral("1 2 2"));
    QCOMPARE(render("{{ 'ab' | list }} {{ [1, 2] | reverse }}"),
             QStringLiteral("[\"a\", \"b\"] [2, 1]"));

    const nlohmann::json context = {
        {"splits", {{{"account", "food"}, {"amount", 5}},
                    {{"account", "rent"}, {"amount", 20}}}},
    };
    QCOMPARE(render("{{ splits | sum(attribute='amount') }}", context), QStringLiteral("25"));
    QCOMPARE(render("{{ splits | sort(attribute='amount', reverse=true) | join(',', 'account') }}",
                    context),
             QStringLiteral("rent,food"));
}

void TemplateRenderTests::testTests()
{
    QCOMPARE(render("{{ x is defined }} {{ y is undefined }} {{ x is not none }}", {{"x", 1}}),
             QStringLiteral("true true true"));
    QCOMPARE(render("{{ 4 is even }} {{ 4 is odd }} {{ 9 is divisibleby(3) }}"),
             QStringLiteral("true false true"));
    QCOMPARE(render("{{ 9 is divisibleby 3 }} {{ 10 is not divisibleby 3 and true }}"),
             QStringLiteral("true true"));
    QCOMPARE(render("{% if n is divisibleby step %}even split{% endif %}",
                    {{"n", 12}, {"step", 4}}),
             QStringLiteral("even split"));
    QCOMPARE(render("{{ 1 is integer }} {{ 1.0 is float }} {{ 1.0 is number }} {{ 'a' is string }}"),
             QStringLiteral("true true true true"));
    QCOMPARE(render("{{ {} is mapping }} {{ [] is sequence }} {{ none is none }}"),
             QStringLiteral("true true true"));
}

void TemplateRenderTests::testIntegerLimits()
{
    const nlohmann::json context = {{"x", std::numeric_limits<int64_t>::min()}};
    QCOMPARE(render("{{ x % -1 }} {{ 7 % -1 }}", context), QStringLiteral("0 0"));
    QCOMPARE(render("{{ x is divisibleby(-1) }} {{ x is divisibleby(2) }}", context),
             QStringLiteral("true true"));
    QCOMPARE(render("{{ x // 1 }}", context), QStringLiteral("-9223372036854775808"));
    QCOMPARE(render("{{ -9.0e18 | int }}"), QStringLiteral("-9000000000000000000"));
}

void TemplateRenderTests::testIfElifElse()
{
    const std::string source
        = "{% if n > 10 %}big{% elif n > 5 %}medium{% else %}small{% endif %}";
    QCOMPARE(render(source, {{"n", 20}}), QStringLiteral("big"));
    QCOMPARE(render(source, {{"n", 7}}), QStringLiteral("medium"));
    QCOMPARE(render(source, {{"n", 1}}), QStringLiteral("small"));
}

void TemplateRenderTests::testForLoops()
{
    QCOMPARE(render("{% for n in range(3) %}{{ n }}{% endfor %}"), QStringLiteral("012"));
    QCOMPARE(render("{% for n in range(10, 0, -3) %}{{ n }} {% endfor %}"),
             QStringLiteral("10 7 4 1 "));
    QCOMPARE(render("{% for i in range(6) if i is even %}{{ i }}{% endfor %}"),
             QStringLiteral("024"));
    QCOMPARE(render("{% for i in [] %}x{% else %}empty{% endfor %}"), QStringLiteral("empty"));
    QCOMPARE(render("{% for k, v in split.items() %}{{ k }}={{ v }};{% endfor %}",
                    {{"split", {{"food", 1}, {"rent", 2}}}}),
             QStringLiteral("food=1;rent=2;"));
    QCOMPARE(render("{% for k in split %}{{ k }}{% endfor %}{{ split.values() | sum }}",
                    {{"split", {{"a", 1}, {"b", 2}}}}),
             QStringLiteral("ab3"));
    QCOMPARE(render("{% for a, b in [[1, 2], [3, 4]] %}{{ a * b }},{% endfor %}"),
             QStringLiteral("2,12,"));
}

void TemplateRenderTests::testLoopVariable()
{
    QCOMPARE(render("{% for n in ['a', 'b', 'c'] %}{{ loop.index }}{{ n }}"
                    "{% if not loop.last %}, {% endif %}{% endfor %}"),
             QStringLiteral("1a, 2b, 3c"));
    QCOMPARE(render("{% for n in 'xyz' %}{{ loop.revindex0 }}{{ loop.first }}/{% endfor %}"),
             QStringLiteral("2true/1false/0false/"));
    QCOMPARE(render("{% for n in range(4) %}{{ loop.length }}{% endfor %}"),
             QStringLiteral("4444"));
}

void TemplateRenderTests::testSetScoping()
{
    QCOMPARE(render("{% set x = 1 %}{% for i in [5, 6] %}{% set x = i %}{{ x }}{% endfor %}{{ x }}"),
             QStringLiteral("561"));
    QCOMPARE(render("{% set total = amount * 2 %}{{ total }}", {{"amount", 21}}),
             QStringLiteral("42"));
    QCOMPARE(render("{% set amount = 1 %}{{ amount }}", {{"amount", 21}}), QStringLiteral("1"));
}

void TemplateRenderTests::testWhitespaceControl()
{
    QCOMPARE(render("a  {{- 1 -}}  b"), QStringLiteral("a1b"));
    QCOMPARE(render("{% for i in [1, 2] -%}\n  {{ i }}\n{%- endfor %}"), QStringLiteral("12"));
    QCOMPARE(render("line\n"), QStringLiteral("line"));

    ptatemp::templating::Environment env;
    env.setKeepTrailingNewline(true);
    QCOMPARE(QString::fromStdString(env.renderString("line\n", nlohmann::json::object())),
             QStringLiteral("line\n"));
}

void TemplateRenderTests::testTrimBlocks()
{
    const std::string source = "{% if true %}\nassets  1\n{% endif %}\nexpenses  -1\n";
    QCOMPARE(render(source), QStringLiteral("\nassets  1\n\nexpenses  -1"));

    ptatemp::templating::Environment env;
    env.setTrimBlocks(true);
    QCOMPARE(QString::fromStdString(env.renderString(source, nlohmann::json::object())),
             QStringLiteral("assets  1\nexpenses  -1"));
}

void TemplateRenderTests::testRawAndComments()
{
    QCOMPARE(render("{% raw %}{{ kept }}{% endraw %}"), QStringLiteral("{{ kept }}"));
    QCOMPARE(render("a{# dropped #}b"), QStringLiteral("ab"));
    QCOMPARE(render("{ not a tag }"), QStringLiteral("{ not a tag }"));
}

void TemplateRenderTests::testCompiledTemplateIsReusable()
{
    ptatemp::templating::Environment env;
    const ptatemp::templating::Template tmpl = env.compile("{{ who }}!");
    QCOMPARE(QString::fromStdString(tmpl.render({{"who", "a"}})), QStringLiteral("a!"));
    QCOMPARE(QString::fromStdString(tmpl.render({{"who", "b"}})), QStringLiteral("b!"));
    QCOMPARE(QString::fromStdString(tmpl.render(nullptr)), QStringLiteral("!"));
}

QTEST_MAIN(TemplateRenderTests)
#include "test_template_render.moc"

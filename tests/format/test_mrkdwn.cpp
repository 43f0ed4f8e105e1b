#include <catch2/catch_test_macros.hpp>

#include "slackline/format/mrkdwn.hpp"

#include <string>
#include <vector>

using slackline::format::to_mrkdwn;

TEST_CASE("to_mrkdwn basic conversions", "[format][mrkdwn]") {
    CHECK(to_mrkdwn("**bold** and *italic*") == "*bold* and _italic_");
    CHECK(to_mrkdwn("# Title") == "*Title*");
    CHECK(to_mrkdwn("- item") == "* item");
    CHECK(to_mrkdwn("~~gone~~") == "~gone~");
    CHECK(to_mrkdwn("__also bold__") == "*also bold*");
    CHECK(to_mrkdwn("[Docs](https://example.com)") == "<https://example.com|Docs>");
}

TEST_CASE("to_mrkdwn empty and plain input", "[format][mrkdwn]") {
    CHECK(to_mrkdwn("") == "");
    CHECK(to_mrkdwn("just text") == "just text");
    CHECK(to_mrkdwn("snake_case_name stays") == "snake_case_name stays");
    CHECK(to_mrkdwn("_already italic_") == "_already italic_");
}

TEST_CASE("to_mrkdwn headers", "[format][mrkdwn]") {
    SECTION("every level up to six") {
        CHECK(to_mrkdwn("### Section") == "*Section*");
        CHECK(to_mrkdwn("###### Deep") == "*Deep*");
        CHECK(to_mrkdwn("####### Seven") == "####### Seven");
    }

    SECTION("needs whitespace and text") {
        CHECK(to_mrkdwn("#hashtag") == "#hashtag");
        CHECK(to_mrkdwn("#   ") == "#   ");
    }

    SECTION("bold-wrapped header becomes one bold span") {
        CHECK(to_mrkdwn("## **Heading**") == "*Heading*");
        CHECK(to_mrkdwn("## __Heading__") == "*Heading*");
        CHECK(to_mrkdwn("# Title with **bold** word") == "*Title with bold word*");
    }

    SECTION("each line independently") {
        CHECK(to_mrkdwn("# One\ntext\n## Two") == "*One*\ntext\n*Two*");
    }

    SECTION("header text is not italicised") {
        CHECK(to_mrkdwn("# Release notes\n*new* things") == "*Release notes*\n_new_ things");
    }
}

TEST_CASE("to_mrkdwn emphasis", "[format][mrkdwn]") {
    SECTION("bold and italic on the same line") {
        CHECK(to_mrkdwn("*a* **b** *c*") == "_a_ *b* _c_");
    }

    SECTION("arithmetic stays literal") {
        CHECK(to_mrkdwn("2 * 3 * 4") == "2 * 3 * 4");
    }

    SECTION("unbalanced markers stay literal") {
        CHECK(to_mrkdwn("**open") == "**open");
        CHECK(to_mrkdwn("*open") == "*open");
        CHECK(to_mrkdwn("~~open") == "~~open");
        CHECK(to_mrkdwn("[label](") == "[label](");
    }

    SECTION("italic does not cross lines") {
        CHECK(to_mrkdwn("*a\nb*") == "*a\nb*");
    }

    SECTION("bold crossing a line break still converts") {
        CHECK(to_mrkdwn("**a\nb**") == "*a\nb*");
    }
}

TEST_CASE("to_mrkdwn links", "[format][mrkdwn]") {
    SECTION("URL characters are never rewritten") {
        CHECK(to_mrkdwn("[wiki](https://x.org/a_b_c*d*)") == "<https://x.org/a_b_c*d*|wiki>");
        CHECK(to_mrkdwn("see [a](http://x/~~y~~)") == "see <http://x/~~y~~|a>");
    }

    SECTION("label emphasis converts") {
        CHECK(to_mrkdwn("[**bold** link](http://x)") == "<http://x|*bold* link>");
    }

    SECTION("several links") {
        CHECK(to_mrkdwn("[a](http://a) and [b](http://b)") ==
              "<http://a|a> and <http://b|b>");
    }
}

TEST_CASE("to_mrkdwn bullets", "[format][mrkdwn]") {
    CHECK(to_mrkdwn("- one\n- two") == "* one\n* two");
    CHECK(to_mrkdwn("  - nested") == "  * nested");
    CHECK(to_mrkdwn("- *item*") == "* _item_");
    CHECK(to_mrkdwn("-not a bullet") == "-not a bullet");
    CHECK(to_mrkdwn("a - b") == "a - b");
}

TEST_CASE("to_mrkdwn leaves code alone", "[format][mrkdwn]") {
    CHECK(to_mrkdwn("use `**kwargs` here") == "use `**kwargs` here");
    CHECK(to_mrkdwn("```\n# not a header\n- x\n```") == "```\n# not a header\n- x\n```");
    CHECK(to_mrkdwn("**bold** `*raw*`") == "*bold* `*raw*`");
}

TEST_CASE("to_mrkdwn strips reserved control characters", "[format][mrkdwn]") {
    CHECK(to_mrkdwn("a\x1F" "b\x1A" "c") == "abc");
    CHECK(to_mrkdwn("\x1A" "C0\x1A") == "C0");
}

TEST_CASE("to_mrkdwn mixed document", "[format][mrkdwn]") {
    auto input =
        "# Summary\n"
        "\n"
        "Results are **ready**, see [the report](https://r.example/x_y).\n"
        "\n"
        "- ~~old~~ *new*\n"
        "- `raw_*value*`";
    auto expected =
        "*Summary*\n"
        "\n"
        "Results are *ready*, see <https://r.example/x_y|the report>.\n"
        "\n"
        "* ~old~ _new_\n"
        "* `raw_*value*`";
    CHECK(to_mrkdwn(input) == expected);
}

TEST_CASE("to_mrkdwn link URLs stop at the line end", "[format][mrkdwn]") {
    CHECK(to_mrkdwn("see [docs](http://h\n## Setup)") == "see [docs](http://h\n*Setup)*");
    CHECK(to_mrkdwn("[a](x\n# y)") == "[a](x\n*y)*");
    CHECK(to_mrkdwn("[a](http://x)\n# y") == "<http://x|a>\n*y*");
}

TEST_CASE("to_mrkdwn never emits control characters", "[format][mrkdwn]") {
    const std::vector<std::string> inputs = {
        "see [docs](http://h\n## Setup)",
        "[a](x\n# y)",
        "# **a\nb**",
        "[**x](y\n## z**)",
        "# __init__ file\n[l](u\n# h) *i*",
        "\x1F# a\x1A\n- [b](c)",
        "**a\n# b\n__c__**",
    };

    std::vector<std::string> leaking;
    for (const auto& input : inputs) {
        for (char c : to_mrkdwn(input)) {
            if (static_cast<unsigned char>(c) < 0x20 && c != '\n' && c != '\t') {
                leaking.push_back(input);
                break;
            }
        }
    }
    CHECK(leaking.empty());
}

TEST_CASE("to_mrkdwn header drops inner underscore pairs", "[format][mrkdwn]") {
    CHECK(to_mrkdwn("# __init__ file") == "*init file*");
    CHECK(to_mrkdwn("## __Heading__") == "*Heading*");
}

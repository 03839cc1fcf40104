/*

Copyright (c) 2008-2009, 2013-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/aux_/xml_parse.hpp"
#include "igd/aux_/string_util.hpp"
#include "test.hpp"

#include <functional>
#include <string>

using namespace igd;
using namespace igd::aux;
using namespace std::placeholders;

namespace {

void parser_callback(std::string& out, int token, string_view s
	, string_view val)
{
	switch (token)
	{
		case xml_start_tag: out += "B"; break;
		case xml_end_tag: out += "F"; break;
		case xml_empty_tag: out += "E"; break;
		case xml_declaration_tag: out += "D"; break;
		case xml_comment: out += "C"; break;
		case xml_string: out += "S"; break;
		case xml_attribute: out += "A"; break;
		case xml_parse_error: out += "P"; break;
		case xml_tag_content: out += "T"; break;
		case xml_markup_tag: out += "M"; break;
		default: TEST_CHECK(false);
	}
	out.append(s.begin(), s.end());
	if (token == xml_attribute)
	{
		out += "V";
		out.append(val.begin(), val.end());
	}
	else
	{
		TEST_CHECK(val.empty());
	}
}

void test_parse(char const* in, char const* expected)
{
	std::string out;
	xml_parse(in, std::bind(&parser_callback, std::ref(out), _1, _2, _3));
	std::printf("in: %s\n     out: %s\nexpected: %s\n"
		, in, out.c_str(), expected);
	TEST_EQUAL(out, expected);
}

} // anonymous namespace

IGD_TEST(tags)
{
	test_parse("<a>foo<b/>bar</a>", "BaSfooEbSbarFa");
}

IGD_TEST(declaration_attributes_comment)
{
	test_parse("<?xml version = \"1.0\"?><c x=\"1\" \t y=\"3\"/><d foo='bar'></d boo='foo'><!--comment-->"
		, "DxmlAversionV1.0EcAxV1AyV3BdAfooVbarFdAbooVfooCcomment");
}

IGD_TEST(comment_with_spaces)
{
	test_parse("<a><!-- a <b> c --></a>", "BaC a <b> c Fa");
}

IGD_TEST(empty_tag)
{
	test_parse("<foo/>", "Efoo");
	test_parse("<foo  />", "Efoo");
}

IGD_TEST(declaration_without_attributes)
{
	test_parse("<?xml?>", "Dxml");
	test_parse("<?xml  ?>", "Dxml");
}

IGD_TEST(namespaced_tags)
{
	test_parse("<s:Body><u:Foo xmlns:u=\"urn:x\"/></s:Body>"
		, "Bs:BodyEu:FooAxmlns:uVurn:xFs:Body");
}

IGD_TEST(attribute_missing_quote)
{
	test_parse("<a f=1>foo</a f='b>"
		, "BaPunquoted attribute valueSfooFaPmissing end quote on attribute");
}

IGD_TEST(tag_content)
{
	test_parse("<a  f>foo</a  v  >", "BaTfSfooFaTv  ");
}

IGD_TEST(doctype)
{
	test_parse("<!DOCTYPE html>", "MDOCTYPEThtml");
	test_parse("<!DOCTYPE root><root/>", "MDOCTYPETrootEroot");
}

IGD_TEST(cdata)
{
	test_parse("<![CDATA[verbatim tag that can have > and < in it]]>"
		, "Sverbatim tag that can have > and < in it");
	test_parse("<![CDATA[foo", "Punexpected end of file");
}

IGD_TEST(unterminated)
{
	test_parse("<foo", "Punexpected end of file");
	test_parse("<foo a=\"bar", "Punexpected end of file");
	test_parse("<!-- foo", "Punexpected end of file");
	test_parse("<foo a=\"bar>", "BfooPmissing end quote on attribute");
}

IGD_TEST(complete_documents)
{
	TEST_CHECK(xml_complete("<root><a>1</a><b/></root>"));
	TEST_CHECK(xml_complete("<?xml version=\"1.0\"?>\r\n<root>x</root>\r\n"));
	TEST_CHECK(xml_complete("<root/>"));
	TEST_CHECK(xml_complete("<root><!-- <unbalanced> --></root>"));
	TEST_CHECK(xml_complete("<?xml version=\"1.0\"?>\n<!DOCTYPE root>\n"
		"<root xmlns=\"urn:schemas-upnp-org:device-1-0\"><a>1</a></root>"));
	TEST_CHECK(!xml_complete("<!DOCTYPE root>\n<root><a>1</a>"));
}

IGD_TEST(incomplete_documents)
{
	TEST_CHECK(!xml_complete(""));
	TEST_CHECK(!xml_complete("<?xml version=\"1.0\"?>"));
	TEST_CHECK(!xml_complete("<root><a>1</a>"));
	TEST_CHECK(!xml_complete("<root><a>1</a></ro"));
	TEST_CHECK(!xml_complete("<root><a>1</b></root>"));
	TEST_CHECK(!xml_complete("<root></root><second/>"));
	TEST_CHECK(!xml_complete("<root></root>trailing text"));
}

IGD_TEST(strip_string)
{
	TEST_EQUAL(strip_string("  \t foo bar \r\n"), "foo bar");
	TEST_EQUAL(strip_string("   "), "");
	TEST_EQUAL(strip_string(""), "");
}

IGD_TEST(local_name)
{
	TEST_EQUAL(local_name("u:GetExternalIPAddress"), "GetExternalIPAddress");
	TEST_EQUAL(local_name("Envelope"), "Envelope");
}

IGD_TEST(no_case_compare)
{
	TEST_CHECK(string_equal_no_case("ServiceList", "servicelist"));
	TEST_CHECK(!string_equal_no_case("service", "services"));
	TEST_CHECK(string_begins_no_case("HTTP://"_sv, "http://10.0.0.1"_sv));
	TEST_CHECK(!string_begins_no_case("http://"_sv, "https://10.0.0.1"_sv));
	TEST_CHECK(!string_begins_no_case("http://"_sv, "http:"_sv));
}

IGD_TEST(parse_int)
{
	std::int64_t v = 0;
	TEST_CHECK(aux::parse_int(" 8080 ", v));
	TEST_EQUAL(v, 8080);
	TEST_CHECK(aux::parse_int("-1", v));
	TEST_EQUAL(v, -1);
	TEST_CHECK(!aux::parse_int("", v));
	TEST_CHECK(!aux::parse_int("12a", v));
	TEST_CHECK(!aux::parse_int("-", v));
	TEST_CHECK(!aux::parse_int("99999999999999999999", v));
}

IGD_TEST(escape)
{
	TEST_EQUAL(xml_escape("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
	TEST_EQUAL(xml_unescape("a&lt;b&gt;&amp;&quot;c&apos;"), "a<b>&\"c'");
	TEST_EQUAL(xml_unescape("caf&#233; &#x41;"), "caf\xc3\xa9 A");
	TEST_EQUAL(xml_unescape("a & b"), "a & b");
	TEST_EQUAL(xml_unescape("&unknown;"), "&unknown;");
}

/*
	message_id.cc
	-------------
*/

// Standard C
#include <string.h>

// sabnews
#include "sabnews/message_id.hh"

// tap-out
#include "tap/test.hh"


static const unsigned n_tests = 6 + 2 + 2 + 6 + 12 + 4;


using namespace sabnews;


static bool equals( const plus::string& s, const char* expected )
{
	const size_t n = strlen( expected );
	
	return s.size() == n  &&  memcmp( s.data(), expected, n ) == 0;
}

static bool parses( const char* line, article_request& r )
{
	return parse_article_command( line, strlen( line ), r );
}

static bool rejects( const char* line )
{
	article_request r;
	
	return ! parses( line, r );
}

static void well_formed()
{
	article_request r;
	
	EXPECT( parses( "ARTICLE <file=folder/name.mkv|part=4|start=5000|size=5000>\r\n", r ) );
	
	EXPECT( equals( r.file, "folder/name.mkv" ) );
	
	EXPECT( equals( r.message_id, "<file=folder/name.mkv|part=4|start=5000|size=5000>" ) );
	
	EXPECT( r.part == 4 );
	
	EXPECT( r.start == 5000 );
	
	EXPECT( r.size == 5000 );
}

static void body()
{
	article_request r;
	
	EXPECT( parses( "BODY <file=test.bin|part=1|start=0|size=10>\r\n", r ) );
	
	EXPECT( equals( r.file, "test.bin" )  &&  r.part == 1  &&  r.start == 0  &&  r.size == 10 );
}

static void zeros()
{
	article_request r;
	
	EXPECT( parses( "ARTICLE <file=|part=0|start=0|size=0>\r\n", r ) );
	
	EXPECT( r.file.empty()  &&  r.part == 0 );
}

static void large_numbers()
{
	article_request r;
	
	EXPECT( parses( "ARTICLE <file=x|part=1|start=18446744073709551615|size=0>\r\n", r ) );
	
	EXPECT( r.start == 18446744073709551615ull );
	
	EXPECT( parses( "ARTICLE <file=x|part=1|start=18446744073709551616|size=0>\r\n", r ) );
	
	EXPECT( r.start == 18446744073709551615ull );
	
	EXPECT( parses( "ARTICLE <file=x|part=1|start=0|size=99999999999999999999999>\r\n", r ) );
	
	EXPECT( r.size == 18446744073709551615ull );
}

static void malformed()
{
	EXPECT( rejects( "ARTICLE <file=a|part=1|start=0|size=10>\n" ) );
	EXPECT( rejects( "ARTICLE <file=a|part=1|start=0|size=10>" ) );
	EXPECT( rejects( "ARTICLE <file=a|part=1|start=0>\r\n" ) );
	EXPECT( rejects( "ARTICLE <file=a|part=x|start=0|size=10>\r\n" ) );
	EXPECT( rejects( "ARTICLE <file=a|part=1|start=-1|size=10>\r\n" ) );
	EXPECT( rejects( "ARTICLE <file=a|part=|start=0|size=10>\r\n" ) );
	EXPECT( rejects( "ARTICLE <file=a|b|part=1|start=0|size=10>\r\n" ) );
	EXPECT( rejects( "ARTICLE <file=a|part=1|start=0|size=10> \r\n" ) );
	EXPECT( rejects( "ARTICLE  <file=a|part=1|start=0|size=10>\r\n" ) );
	EXPECT( rejects( "article <file=a|part=1|start=0|size=10>\r\n" ) );
	EXPECT( rejects( "ARTICLE <12345@example.com>\r\n" ) );
	EXPECT( rejects( "ARTICLE\r\n" ) );
}

static void formatting()
{
	plus::var_string id = format_message_id( "dir/file.bin", 2, 100, 50 );
	
	EXPECT( equals( id, "<file=dir/file.bin|part=2|start=100|size=50>" ) );
	
	EXPECT( strcmp( file_base_name( "dir/sub/file.bin" ), "file.bin" ) == 0 );
	
	EXPECT( strcmp( file_base_name( "file.bin" ), "file.bin" ) == 0 );
	
	EXPECT( strcmp( file_base_name( "dir/" ), "" ) == 0 );
}

int main( int argc, char** argv )
{
	tap::start( "message_id", n_tests );
	
	well_formed();
	body();
	zeros();
	large_numbers();
	malformed();
	formatting();
	
	return 0;
}

/*
	yenc.cc
	-------
*/

// POSIX
#include <unistd.h>

// Standard C
#include <stdio.h>
#include <string.h>

// plus
#include "plus/var_string.hh"

// sabnews
#include "sabnews/send_queue.hh"
#include "sabnews/yenc.hh"

// tap-out
#include "tap/check.hh"
#include "tap/test.hh"


static const unsigned n_tests = 1 + 1 + 1 + 1 + 2 + 2;


using namespace sabnews;


#define STR_LEN( s )  "" s, (sizeof s - 1)


static FILE* the_capture;

static int capture_fd()
{
	if ( the_capture )
	{
		fclose( the_capture );
	}
	
	the_capture = tmpfile();
	
	return fileno( the_capture );
}

static plus::var_string captured( send_queue& queue )
{
	queue.flush();
	
	const int fd = queue.fd();
	
	CHECK( lseek( fd, 0, SEEK_SET ) );
	
	plus::var_string result;
	
	char buffer[ 4096 ];
	
	while ( ssize_t n_read = CHECK( read( fd, buffer, sizeof buffer ) ) )
	{
		result.append( buffer, n_read );
	}
	
	return result;
}

static bool equals( const plus::string& s, const char* expected, size_t n )
{
	return s.size() == n  &&  memcmp( s.data(), expected, n ) == 0;
}

static plus::var_string decode( const plus::string& encoded, unsigned* n_lines )
{
	plus::var_string result;
	
	const char* p   = encoded.data();
	const char* end = p + encoded.size();
	
	*n_lines = 0;
	
	while ( const char* lf = (const char*) memchr( p, '\n', end - p ) )
	{
		const char* eol = lf[ -1 ] == '\r' ? lf - 1 : lf;
		
		while ( p < eol )
		{
			unsigned char c = *p++;
			
			if ( c == '='  &&  p < eol )
			{
				c = *p++ - 64;
			}
			
			c -= 42;
			
			result.append( (const char*) &c, 1 );
		}
		
		p = lf + 1;
		
		++*n_lines;
	}
	
	return result;
}

static void digits()
{
	const yenc_part part = { "test.bin", 1, 0, 10, crc_empty };
	
	send_queue queue( capture_fd() );
	
	queue_yenc( queue, part, STR_LEN( "0123456789" ) );
	
	const char expected[] =
		"=ybegin part=1 line=128 size=10 name=test.bin\r\n"
		"=ypart begin=1 end=10\r\n"
		"Z\r\n" "[\r\n" "\\\r\n" "]\r\n" "^\r\n"
		"_\r\n" "`\r\n" "a\r\n" "b\r\n" "c\r\n"
		"=yend size=10 part=1 pcrc32=00000000\r\n";
	
	EXPECT( equals( captured( queue ), expected, sizeof expected - 1 ) );
}

static void escapes()
{
	// encode to NUL, LF, CR, '=', '.'
	const char data[] = { '\xD6', '\xE0', '\xE3', '\x13', '\x04' };
	
	send_queue queue( capture_fd() );
	
	queue_yenc_data( queue, data, sizeof data );
	
	EXPECT( equals( captured( queue ), STR_LEN( "=@\r\n=J\r\n=M\r\n=}\r\n=n\r\n" ) ) );
}

static void offset_header()
{
	const yenc_part part = { "a.bin", 3, 5000, 20000, crc_empty };
	
	send_queue queue( capture_fd() );
	
	queue_yenc_header( queue, part, 5000 );
	
	const char expected[] =
		"=ybegin part=3 line=128 size=20000 name=a.bin\r\n"
		"=ypart begin=5001 end=10000\r\n";
	
	EXPECT( equals( captured( queue ), expected, sizeof expected - 1 ) );
}

static void empty_range()
{
	const yenc_part part = { "test.bin", 1, 10, 10, crc_empty };
	
	send_queue queue( capture_fd() );
	
	queue_yenc( queue, part, NULL, 0 );
	
	const char expected[] =
		"=ybegin part=1 line=128 size=10 name=test.bin\r\n"
		"=ypart begin=11 end=10\r\n"
		"=yend size=0 part=1 pcrc32=00000000\r\n";
	
	EXPECT( equals( captured( queue ), expected, sizeof expected - 1 ) );
}

static void crc()
{
	yenc_part part = { "check.bin", 2, 0, 9, crc_payload };
	
	send_queue queue( capture_fd() );
	
	queue_yenc_footer( queue, part, STR_LEN( "123456789" ) );
	
	EXPECT( equals( captured( queue ), STR_LEN( "=yend size=9 part=2 pcrc32=cbf43926\r\n" ) ) );
	
	part.crc = crc_empty;
	
	send_queue compat( capture_fd() );
	
	queue_yenc_footer( compat, part, STR_LEN( "123456789" ) );
	
	EXPECT( equals( captured( compat ), STR_LEN( "=yend size=9 part=2 pcrc32=00000000\r\n" ) ) );
}

static void all_bytes()
{
	char data[ 256 ];
	
	for ( int i = 0;  i < 256;  ++i )
	{
		data[ i ] = char( i );
	}
	
	send_queue queue( capture_fd() );
	
	queue_yenc_data( queue, data, sizeof data );
	
	unsigned n_lines;
	
	plus::var_string decoded = decode( captured( queue ), &n_lines );
	
	EXPECT( equals( decoded, data, sizeof data ) );
	
	EXPECT( n_lines == 256 );
}

int main( int argc, char** argv )
{
	tap::start( "yenc", n_tests );
	
	digits();
	escapes();
	offset_header();
	empty_range();
	crc();
	all_bytes();
	
	return 0;
}

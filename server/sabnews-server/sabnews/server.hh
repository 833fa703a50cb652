/*
	sabnews/server.hh
	-----------------
*/

#ifndef SABNEWS_SERVER_HH
#define SABNEWS_SERVER_HH

// Standard C++
#include <cstddef>


namespace sabnews
{
	
	// Settings, made once before any session starts
	
	void set_true_crc( bool true_crc );
	void set_verbose ( bool verbose  );
	
	/*
		Line handler for a session (the context is a session*).  Returns 1
		after QUIT, -errno if the connection can't be written to, else 0.
	*/
	
	int command_handler( void* that, const char* line, std::size_t n );
	
	/*
		Greets, then serves commands read from input_fd until QUIT or
		end of input.  Returns 0 or -errno.
	*/
	
	int run_session( int input_fd, int output_fd );
	
}

#endif

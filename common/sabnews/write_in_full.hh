/*
	sabnews/write_in_full.hh
	------------------------
*/

#ifndef SABNEWS_WRITEINFULL_HH
#define SABNEWS_WRITEINFULL_HH

// POSIX
#include <sys/types.h>


namespace sabnews
{
	
	/*
		Writes all n bytes to fd, waiting out EAGAIN and EINTR.
		Any other failure (e.g. EPIPE when the peer has gone away) is
		thrown as poseven::errno_t.
	*/
	
	void write_in_full( int fd, const void* buffer, size_t n );
	
}

#endif

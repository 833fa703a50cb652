/*
	sabnews/listener.hh
	-------------------
*/

#ifndef SABNEWS_LISTENER_HH
#define SABNEWS_LISTENER_HH


namespace sabnews
{
	
	/*
		Binds an IPv4 stream socket to host:port and listens on it.
		Throws poseven::errno_t (EINVAL for a host that isn't a dotted quad).
	*/
	
	int listen_tcp( const char* host, unsigned port );
	
	typedef int (*connection_function)( int fd );
	
	/*
		Accepts connections forever, serving each in a child process that
		runs f on the connected socket.  Only returns on a failure of the
		listening socket itself, with -errno.
	*/
	
	int serve_connections( int listener_fd, connection_function f );
	
}

#endif

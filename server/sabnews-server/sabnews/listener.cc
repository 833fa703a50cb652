/*
	sabnews/listener.cc
	-------------------
*/

#include "sabnews/listener.hh"

// POSIX
#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

// Standard C
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// poseven
#include "poseven/types/errno_t.hh"


namespace sabnews
{
	
	namespace p7 = poseven;
	
	
	int listen_tcp( const char* host, unsigned port )
	{
		struct sockaddr_in addr;
		
		memset( &addr, 0, sizeof addr );
		
		addr.sin_family = AF_INET;
		addr.sin_port   = htons( port );
		
		if ( port > 0xFFFF  ||  inet_pton( AF_INET, host, &addr.sin_addr ) != 1 )
		{
			p7::throw_errno( EINVAL );
		}
		
		int fd = p7::throw_posix_result( socket( AF_INET, SOCK_STREAM, 0 ) );
		
		const int reuse = 1;
		
		try
		{
			p7::throw_posix_result( setsockopt( fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof reuse ) );
			
			p7::throw_posix_result( bind( fd, (const sockaddr*) &addr, sizeof addr ) );
			
			p7::throw_posix_result( listen( fd, SOMAXCONN ) );
		}
		catch ( const p7::errno_t& )
		{
			close( fd );
			
			throw;
		}
		
		return fd;
	}
	
	static
	void reap_children_automatically()
	{
		struct sigaction action;
		
		memset( &action, 0, sizeof action );
		
		action.sa_handler = SIG_DFL;
		action.sa_flags   = SA_NOCLDWAIT;
		
		p7::throw_posix_result( sigaction( SIGCHLD, &action, NULL ) );
	}
	
	static
	void log_peer( const struct sockaddr_in& peer )
	{
		char name[ INET_ADDRSTRLEN ] = "?";
		
		inet_ntop( AF_INET, &peer.sin_addr, name, sizeof name );
		
		fprintf( stderr, "Connection from %s:%u\n", name, ntohs( peer.sin_port ) );
	}
	
	int serve_connections( int listener_fd, connection_function f )
	{
		try
		{
			reap_children_automatically();
		}
		catch ( const p7::errno_t& err )
		{
			return -err;
		}
		
		for ( ;; )
		{
			struct sockaddr_in peer;
			
			socklen_t peer_size = sizeof peer;
			
			const int fd = accept( listener_fd, (sockaddr*) &peer, &peer_size );
			
			if ( fd < 0 )
			{
				switch ( errno )
				{
					case EINTR:
					case ECONNABORTED:
					case EPROTO:
						continue;
					
					case EMFILE:
					case ENFILE:
					case ENOBUFS:
					case ENOMEM:
						fprintf( stderr, "accept: %s\n", strerror( errno ) );
						
						sleep( 1 );
						continue;
					
					default:
						return -errno;
				}
			}
			
			log_peer( peer );
			
			const pid_t pid = fork();
			
			if ( pid == 0 )
			{
				close( listener_fd );
				
				const int status = f( fd );
				
				close( fd );
				
				_exit( status != 0 );
			}
			
			if ( pid < 0 )
			{
				fprintf( stderr, "fork: %s\n", strerror( errno ) );
			}
			
			close( fd );
		}
	}
	
}

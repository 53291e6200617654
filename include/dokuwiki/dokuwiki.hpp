#ifndef DOKUWIKI_HPP
#define DOKUWIKI_HPP

// Main header that includes everything

#include <dokuwiki/client.hpp>
#include <dokuwiki/config.hpp>
#include <dokuwiki/credentials.hpp>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/history_exporter.hpp>
#include <dokuwiki/identity_map.hpp>
#include <dokuwiki/log.hpp>
#include <dokuwiki/path_mapper.hpp>
#include <dokuwiki/protocol/helper.hpp>
#include <dokuwiki/push_importer.hpp>
#include <dokuwiki/session.hpp>
#include <dokuwiki/transport.hpp>
#include <dokuwiki/types.hpp>
#include <dokuwiki/version.hpp>

#endif // DOKUWIKI_HPP

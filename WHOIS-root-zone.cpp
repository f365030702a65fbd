#include "WHOIS-registry.hpp"

#include <glog/logging.h>

// IANA root zone database <http://www.iana.org/domains/root/db>, with the
// WHOIS server for each TLD.  A nullptr server marks a TLD known to have
// no public WHOIS service.

namespace {
struct zone {
  char const* suffix;
  char const* server;
};

// clang-format off
constexpr zone root_zone_db[]{
    {".ac",                        "whois.nic.ac"},
    {".academy",                   "whois.donuts.co"},
    {".accountants",               "whois.donuts.co"},
    {".active",                    "whois.afilias-srs.net"},
    {".actor",                     "whois.unitedtld.com"},
    {".ad",                        nullptr},
    {".ae",                        "whois.aeda.net.ae"},
    {".aero",                      "whois.aero"},
    {".af",                        "whois.nic.af"},
    {".ag",                        "whois.nic.ag"},
    {".agency",                    "whois.donuts.co"},
    {".ai",                        "whois.ai"},
    {".airforce",                  "whois.unitedtld.com"},
    {".al",                        nullptr},
    {".allfinanz",                 "whois.ksregistry.net"},
    {".alsace",                    "whois-alsace.nic.fr"},
    {".am",                        "whois.amnic.net"},
    {".an",                        nullptr},
    {".ao",                        nullptr},
    {".aq",                        nullptr},
    {".ar",                        nullptr},
    {".archi",                     "whois.ksregistry.net"},
    {".army",                      "whois.rightside.co"},
    {".arpa",                      "whois.iana.org"},
    {".as",                        "whois.nic.as"},
    {".asia",                      "whois.nic.asia"},
    {".associates",                "whois.donuts.co"},
    {".at",                        "whois.nic.at"},
    {".attorney",                  "whois.rightside.co"},
    {".au",                        "whois.audns.net.au"},
    {".auction",                   "whois.unitedtld.com"},
    {".audio",                     "whois.uniregistry.net"},
    {".autos",                     "whois.afilias-srs.net"},
    {".aw",                        "whois.nic.aw"},
    {".ax",                        "whois.ax"},
    {".axa",                       nullptr},
    {".az",                        nullptr},
    {".ba",                        nullptr},
    {".bar",                       "whois.nic.bar"},
    {".bargains",                  "whois.donuts.co"},
    {".bayern",                    "whois-dub.mm-registry.com"},
    {".bb",                        nullptr},
    {".bd",                        nullptr},
    {".be",                        "whois.dns.be"},
    {".beer",                      "whois-dub.mm-registry.com"},
    {".berlin",                    "whois.nic.berlin"},
    {".best",                      "whois.nic.best"},
    {".bf",                        nullptr},
    {".bg",                        "whois.register.bg"},
    {".bh",                        nullptr},
    {".bi",                        "whois1.nic.bi"},
    {".bid",                       nullptr},
    {".bike",                      "whois.donuts.co"},
    {".bio",                       "whois.ksregistry.net"},
    {".biz",                       "whois.biz"},
    {".bj",                        "whois.nic.bj"},
    {".bl",                        nullptr},
    {".black",                     "whois.afilias.net"},
    {".blackfriday",               "whois.uniregistry.net"},
    {".blue",                      "whois.afilias.net"},
    {".bm",                        nullptr},
    {".bmw",                       "whois.ksregistry.net"},
    {".bn",                        "whois.bn"},
    {".bnpparibas",                "whois.afilias-srs.net"},
    {".bo",                        "whois.nic.bo"},
    {".boo",                       "domain-registry-whois.l.google.com"},
    {".boutique",                  "whois.donuts.co"},
    {".bq",                        nullptr},
    {".br",                        "whois.registro.br"},
    {".brussels",                  "whois.nic.brussels"},
    {".bs",                        nullptr},
    {".bt",                        nullptr},
    {".budapest",                  "whois-dub.mm-registry.com"},
    {".build",                     "whois.nic.build"},
    {".builders",                  "whois.donuts.co"},
    {".business",                  "whois.donuts.co"},
    {".buzz",                      nullptr},
    {".bv",                        nullptr},
    {".bw",                        "whois.nic.net.bw"},
    {".by",                        "whois.cctld.by"},
    {".bz",                        nullptr},
    {".bzh",                       "whois-bzh.nic.fr"},
    {".ca",                        "whois.cira.ca"},
    {".cab",                       "whois.donuts.co"},
    {".cal",                       "domain-registry-whois.l.google.com"},
    {".camera",                    "whois.donuts.co"},
    {".camp",                      "whois.donuts.co"},
    {".cancerresearch",            "whois.nic.cancerresearch"},
    {".capetown",                  "capetown-whois.registry.net.za"},
    {".capital",                   "whois.donuts.co"},
    {".caravan",                   nullptr},
    {".cards",                     "whois.donuts.co"},
    {".care",                      "whois.donuts.co"},
    {".career",                    "whois.nic.career"},
    {".careers",                   "whois.donuts.co"},
    {".casa",                      "whois-dub.mm-registry.com"},
    {".cash",                      "whois.donuts.co"},
    {".cat",                       "whois.cat"},
    {".catering",                  "whois.donuts.co"},
    {".cc",                        "ccwhois.verisign-grs.com"},
    {".cd",                        nullptr},
    {".center",                    "whois.donuts.co"},
    {".ceo",                       "whois.nic.ceo"},
    {".cern",                      "whois.afilias-srs.net"},
    {".cf",                        "whois.dot.cf"},
    {".cg",                        nullptr},
    {".ch",                        "whois.nic.ch"},
    {".channel",                   "domain-registry-whois.l.google.com"},
    {".cheap",                     "whois.donuts.co"},
    {".christmas",                 "whois.uniregistry.net"},
    {".chrome",                    "domain-registry-whois.l.google.com"},
    {".church",                    "whois.donuts.co"},
    {".ci",                        "whois.nic.ci"},
    {".citic",                     nullptr},
    {".city",                      "whois.donuts.co"},
    {".ck",                        nullptr},
    {".cl",                        "whois.nic.cl"},
    {".claims",                    "whois.donuts.co"},
    {".cleaning",                  "whois.donuts.co"},
    {".click",                     "whois.uniregistry.net"},
    {".clinic",                    "whois.donuts.co"},
    {".clothing",                  "whois.donuts.co"},
    {".club",                      "whois.nic.club"},
    {".cm",                        nullptr},
    {".cn",                        "whois.cnnic.cn"},
    {".co",                        "whois.nic.co"},
    {".codes",                     "whois.donuts.co"},
    {".coffee",                    "whois.donuts.co"},
    {".college",                   "whois.centralnic.com"},
    {".cologne",                   "whois-fe1.pdt.cologne.tango.knipp.de"},
    {".com",                       "whois.verisign-grs.com"},
    {".community",                 "whois.donuts.co"},
    {".company",                   "whois.donuts.co"},
    {".computer",                  "whois.donuts.co"},
    {".condos",                    "whois.donuts.co"},
    {".construction",              "whois.donuts.co"},
    {".consulting",                "whois.unitedtld.com"},
    {".contractors",               "whois.donuts.co"},
    {".cooking",                   "whois-dub.mm-registry.com"},
    {".cool",                      "whois.donuts.co"},
    {".coop",                      "whois.nic.coop"},
    {".country",                   "whois-dub.mm-registry.com"},
    {".cr",                        nullptr},
    {".credit",                    "whois.donuts.co"},
    {".creditcard",                "whois.donuts.co"},
    {".cruises",                   "whois.donuts.co"},
    {".cu",                        nullptr},
    {".cuisinella",                "whois.nic.cuisinella"},
    {".cv",                        nullptr},
    {".cw",                        nullptr},
    {".cx",                        "whois.nic.cx"},
    {".cy",                        nullptr},
    {".cymru",                     "whois.nic.cymru"},
    {".cz",                        "whois.nic.cz"},
    {".dad",                       "domain-registry-whois.l.google.com"},
    {".dance",                     "whois.unitedtld.com"},
    {".dating",                    "whois.donuts.co"},
    {".day",                       "domain-registry-whois.l.google.com"},
    {".de",                        "whois.denic.de"},
    {".deals",                     "whois.donuts.co"},
    {".degree",                    "whois.rightside.co"},
    {".democrat",                  "whois.unitedtld.com"},
    {".dental",                    "whois.donuts.co"},
    {".dentist",                   "whois.rightside.co"},
    {".desi",                      "whois.ksregistry.net"},
    {".diamonds",                  "whois.donuts.co"},
    {".diet",                      "whois.uniregistry.net"},
    {".digital",                   "whois.donuts.co"},
    {".direct",                    "whois.donuts.co"},
    {".directory",                 "whois.donuts.co"},
    {".discount",                  "whois.donuts.co"},
    {".dj",                        nullptr},
    {".dk",                        "whois.dk-hostmaster.dk"},
    {".dm",                        "whois.nic.dm"},
    {".dnp",                       nullptr},
    {".do",                        nullptr},
    {".domains",                   "whois.donuts.co"},
    {".durban",                    "durban-whois.registry.net.za"},
    {".dvag",                      "whois.ksregistry.net"},
    {".dz",                        "whois.nic.dz"},
    {".eat",                       "domain-registry-whois.l.google.com"},
    {".ec",                        "whois.nic.ec"},
    {".edu",                       "whois.educause.edu"},
    {".education",                 "whois.donuts.co"},
    {".ee",                        "whois.tld.ee"},
    {".eg",                        nullptr},
    {".eh",                        nullptr},
    {".email",                     "whois.donuts.co"},
    {".engineer",                  "whois.rightside.co"},
    {".engineering",               "whois.donuts.co"},
    {".enterprises",               "whois.donuts.co"},
    {".equipment",                 "whois.donuts.co"},
    {".er",                        nullptr},
    {".es",                        "whois.nic.es"},
    {".esq",                       "domain-registry-whois.l.google.com"},
    {".estate",                    "whois.donuts.co"},
    {".et",                        nullptr},
    {".eu",                        "whois.eu"},
    {".eus",                       "whois.eus.coreregistry.net"},
    {".events",                    "whois.donuts.co"},
    {".exchange",                  "whois.donuts.co"},
    {".expert",                    "whois.donuts.co"},
    {".exposed",                   "whois.donuts.co"},
    {".fail",                      "whois.donuts.co"},
    {".farm",                      "whois.donuts.co"},
    {".feedback",                  "whois.centralnic.com"},
    {".fi",                        "whois.fi"},
    {".finance",                   "whois.donuts.co"},
    {".financial",                 "whois.donuts.co"},
    {".fish",                      "whois.donuts.co"},
    {".fishing",                   "whois-dub.mm-registry.com"},
    {".fitness",                   "whois.donuts.co"},
    {".fj",                        nullptr},
    {".fk",                        nullptr},
    {".flights",                   "whois.donuts.co"},
    {".florist",                   "whois.donuts.co"},
    {".fly",                       "domain-registry-whois.l.google.com"},
    {".fm",                        nullptr},
    {".fo",                        "whois.nic.fo"},
    {".foo",                       "domain-registry-whois.l.google.com"},
    {".forsale",                   "whois.unitedtld.com"},
    {".foundation",                "whois.donuts.co"},
    {".fr",                        "whois.nic.fr"},
    {".frl",                       "whois.nic.frl"},
    {".frogans",                   "whois-frogans.nic.fr"},
    {".fund",                      "whois.donuts.co"},
    {".furniture",                 "whois.donuts.co"},
    {".futbol",                    "whois.unitedtld.com"},
    {".ga",                        nullptr},
    {".gal",                       "whois.gal.coreregistry.net"},
    {".gallery",                   "whois.donuts.co"},
    {".gb",                        nullptr},
    {".gbiz",                      "domain-registry-whois.l.google.com"},
    {".gd",                        "whois.nic.gd"},
    {".ge",                        nullptr},
    {".gent",                      "whois.nic.gent"},
    {".gf",                        nullptr},
    {".gg",                        "whois.gg"},
    {".gh",                        nullptr},
    {".gi",                        "whois2.afilias-grs.net"},
    {".gift",                      "whois.uniregistry.net"},
    {".gifts",                     "whois.donuts.co"},
    {".gives",                     "whois.rightside.co"},
    {".gl",                        "whois.nic.gl"},
    {".glass",                     "whois.donuts.co"},
    {".gle",                       "domain-registry-whois.l.google.com"},
    {".global",                    "whois.afilias-srs.net"},
    {".globo",                     "whois.gtlds.nic.br"},
    {".gm",                        nullptr},
    {".gmail",                     "domain-registry-whois.l.google.com"},
    {".gmo",                       nullptr},
    {".gmx",                       "whois-fe1.gmx.tango.knipp.de"},
    {".gn",                        nullptr},
    {".google",                    "domain-registry-whois.l.google.com"},
    {".gop",                       "whois-cl01.mm-registry.com"},
    {".gov",                       "whois.dotgov.gov"},
    {".gp",                        nullptr},
    {".gq",                        "whois.dominio.gq"},
    {".gr",                        nullptr},
    {".graphics",                  "whois.donuts.co"},
    {".gratis",                    "whois.donuts.co"},
    {".green",                     "whois.afilias.net"},
    {".gripe",                     "whois.donuts.co"},
    {".gs",                        "whois.nic.gs"},
    {".gt",                        nullptr},
    {".gu",                        nullptr},
    {".guide",                     "whois.donuts.co"},
    {".guitars",                   "whois.uniregistry.net"},
    {".guru",                      "whois.donuts.co"},
    {".gw",                        nullptr},
    {".gy",                        "whois.registry.gy"},
    {".hamburg",                   "whois.nic.hamburg"},
    {".haus",                      "whois.unitedtld.com"},
    {".healthcare",                "whois.donuts.co"},
    {".help",                      "whois.uniregistry.net"},
    {".here",                      "domain-registry-whois.l.google.com"},
    {".hiphop",                    "whois.uniregistry.net"},
    {".hiv",                       "whois.afilias-srs.net"},
    {".hk",                        "whois.hkirc.hk"},
    {".hm",                        nullptr},
    {".hn",                        "whois.nic.hn"},
    {".holdings",                  "whois.donuts.co"},
    {".holiday",                   "whois.donuts.co"},
    {".homes",                     "whois.afilias-srs.net"},
    {".horse",                     "whois-dub.mm-registry.com"},
    {".host",                      "whois.nic.host"},
    {".hosting",                   "whois.uniregistry.net"},
    {".house",                     "whois.donuts.co"},
    {".how",                       "domain-registry-whois.l.google.com"},
    {".hr",                        "whois.dns.hr"},
    {".ht",                        "whois.nic.ht"},
    {".hu",                        "whois.nic.hu"},
    {".ibm",                       "whois.nic.ibm"},
    {".id",                        "whois.pandi.or.id"},
    {".ie",                        "whois.domainregistry.ie"},
    {".il",                        "whois.isoc.org.il"},
    {".im",                        "whois.nic.im"},
    {".immo",                      "whois.donuts.co"},
    {".immobilien",                "whois.unitedtld.com"},
    {".in",                        "whois.inregistry.net"},
    {".industries",                "whois.donuts.co"},
    {".info",                      "whois.afilias.net"},
    {".ing",                       "domain-registry-whois.l.google.com"},
    {".ink",                       "whois.centralnic.com"},
    {".institute",                 "whois.donuts.co"},
    {".insure",                    "whois.donuts.co"},
    {".int",                       "whois.iana.org"},
    {".international",             "whois.donuts.co"},
    {".investments",               "whois.donuts.co"},
    {".io",                        "whois.nic.io"},
    {".iq",                        "whois.cmc.iq"},
    {".ir",                        "whois.nic.ir"},
    {".is",                        "whois.isnic.is"},
    {".it",                        "whois.nic.it"},
    {".je",                        "whois.je"},
    {".jetzt",                     nullptr},
    {".jm",                        nullptr},
    {".jo",                        nullptr},
    {".jobs",                      "jobswhois.verisign-grs.com"},
    {".joburg",                    "joburg-whois.registry.net.za"},
    {".jp",                        "whois.jprs.jp"},
    {".juegos",                    "whois.uniregistry.net"},
    {".kaufen",                    "whois.unitedtld.com"},
    {".ke",                        "whois.kenic.or.ke"},
    {".kg",                        "whois.domain.kg"},
    {".kh",                        nullptr},
    {".ki",                        "whois.nic.ki"},
    {".kim",                       "whois.afilias.net"},
    {".kitchen",                   "whois.donuts.co"},
    {".kiwi",                      "whois.nic.kiwi"},
    {".km",                        nullptr},
    {".kn",                        nullptr},
    {".koeln",                     "whois-fe1.pdt.koeln.tango.knipp.de"},
    {".kp",                        nullptr},
    {".kr",                        "whois.kr"},
    {".krd",                       "whois.aridnrs.net.au"},
    {".kred",                      nullptr},
    {".kw",                        nullptr},
    {".ky",                        nullptr},
    {".kz",                        "whois.nic.kz"},
    {".la",                        "whois.nic.la"},
    {".lacaixa",                   "whois.nic.lacaixa"},
    {".land",                      "whois.donuts.co"},
    {".lawyer",                    "whois.rightside.co"},
    {".lb",                        nullptr},
    {".lc",                        nullptr},
    {".lease",                     "whois.donuts.co"},
    {".lgbt",                      "whois.afilias.net"},
    {".li",                        "whois.nic.li"},
    {".life",                      "whois.donuts.co"},
    {".lighting",                  "whois.donuts.co"},
    {".limited",                   "whois.donuts.co"},
    {".limo",                      "whois.donuts.co"},
    {".link",                      "whois.uniregistry.net"},
    {".lk",                        nullptr},
    {".loans",                     "whois.donuts.co"},
    {".london",                    "whois-lon.mm-registry.com"},
    {".lotto",                     "whois.afilias.net"},
    {".lr",                        nullptr},
    {".ls",                        nullptr},
    {".lt",                        "whois.domreg.lt"},
    {".ltda",                      "whois.afilias-srs.net"},
    {".lu",                        "whois.dns.lu"},
    {".luxe",                      "whois-dub.mm-registry.com"},
    {".luxury",                    "whois.nic.luxury"},
    {".lv",                        "whois.nic.lv"},
    {".ly",                        "whois.nic.ly"},
    {".ma",                        "whois.iam.net.ma"},
    {".maison",                    "whois.donuts.co"},
    {".management",                "whois.donuts.co"},
    {".mango",                     "whois.mango.coreregistry.net"},
    {".market",                    "whois.rightside.co"},
    {".marketing",                 "whois.donuts.co"},
    {".mc",                        nullptr},
    {".md",                        "whois.nic.md"},
    {".me",                        "whois.nic.me"},
    {".media",                     "whois.donuts.co"},
    {".meet",                      "whois.afilias.net"},
    {".melbourne",                 "whois.aridnrs.net.au"},
    {".meme",                      "domain-registry-whois.l.google.com"},
    {".menu",                      "whois.nic.menu"},
    {".mf",                        nullptr},
    {".mg",                        "whois.nic.mg"},
    {".mh",                        nullptr},
    {".miami",                     "whois-dub.mm-registry.com"},
    {".mil",                       nullptr},
    {".mini",                      "whois.ksregistry.net"},
    {".mk",                        "whois.marnet.mk"},
    {".ml",                        "whois.dot.ml"},
    {".mm",                        nullptr},
    {".mn",                        "whois.nic.mn"},
    {".mo",                        "whois.monic.mo"},
    {".mobi",                      "whois.dotmobiregistry.net"},
    {".moda",                      "whois.unitedtld.com"},
    {".moe",                       nullptr},
    {".monash",                    "whois.nic.monash"},
    {".mortgage",                  "whois.rightside.co"},
    {".moscow",                    "whois.nic.moscow"},
    {".motorcycles",               "whois.afilias-srs.net"},
    {".mov",                       "domain-registry-whois.l.google.com"},
    {".mp",                        "whois.nic.mp"},
    {".mq",                        nullptr},
    {".mr",                        nullptr},
    {".ms",                        "whois.nic.ms"},
    {".mt",                        nullptr},
    {".mu",                        "whois.nic.mu"},
    {".museum",                    "whois.museum"},
    {".mv",                        nullptr},
    {".mw",                        nullptr},
    {".mx",                        "whois.mx"},
    {".my",                        "whois.mynic.my"},
    {".mz",                        "whois.nic.mz"},
    {".na",                        "whois.na-nic.com.na"},
    {".nagoya",                    nullptr},
    {".name",                      "whois.nic.name"},
    {".navy",                      "whois.rightside.co"},
    {".nc",                        "whois.nc"},
    {".ne",                        nullptr},
    {".net",                       "whois.verisign-grs.com"},
    {".network",                   "whois.donuts.co"},
    {".neustar",                   nullptr},
    {".new",                       "domain-registry-whois.l.google.com"},
    {".nexus",                     "domain-registry-whois.l.google.com"},
    {".nf",                        "whois.nic.nf"},
    {".ng",                        "whois.nic.net.ng"},
    {".ngo",                       "whois.publicinterestregistry.net"},
    {".nhk",                       nullptr},
    {".ni",                        nullptr},
    {".ninja",                     "whois.unitedtld.com"},
    {".nl",                        "whois.domain-registry.nl"},
    {".no",                        "whois.norid.no"},
    {".np",                        nullptr},
    {".nr",                        nullptr},
    {".nra",                       "whois.afilias-srs.net"},
    {".nrw",                       "whois.nic.nrw"},
    {".nu",                        "whois.iis.nu"},
    {".nyc",                       nullptr},
    {".nz",                        "whois.srs.net.nz"},
    {".okinawa",                   nullptr},
    {".om",                        "whois.registry.om"},
    {".ong",                       "whois.publicinterestregistry.net"},
    {".onl",                       "whois.afilias-srs.net"},
    {".ooo",                       "whois.nic.ooo"},
    {".org",                       "whois.pir.org"},
    {".organic",                   "whois.afilias.net"},
    {".otsuka",                    nullptr},
    {".ovh",                       "whois-ovh.nic.fr"},
    {".pa",                        nullptr},
    {".paris",                     "whois-paris.nic.fr"},
    {".partners",                  "whois.donuts.co"},
    {".parts",                     "whois.donuts.co"},
    {".pe",                        "kero.yachay.pe"},
    {".pf",                        "whois.registry.pf"},
    {".pg",                        nullptr},
    {".ph",                        nullptr},
    {".pharmacy",                  nullptr},
    {".photo",                     "whois.uniregistry.net"},
    {".photography",               "whois.donuts.co"},
    {".photos",                    "whois.donuts.co"},
    {".physio",                    "whois.nic.physio"},
    {".pics",                      "whois.uniregistry.net"},
    {".pictures",                  "whois.donuts.co"},
    {".pink",                      "whois.afilias.net"},
    {".pizza",                     "whois.donuts.co"},
    {".pk",                        nullptr},
    {".pl",                        "whois.dns.pl"},
    {".place",                     "whois.donuts.co"},
    {".plumbing",                  "whois.donuts.co"},
    {".pm",                        "whois.nic.pm"},
    {".pn",                        nullptr},
    {".pohl",                      "whois.ksregistry.net"},
    {".post",                      "whois.dotpostregistry.net"},
    {".pr",                        "whois.nic.pr"},
    {".praxi",                     nullptr},
    {".press",                     "whois.nic.press"},
    {".pro",                       "whois.dotproregistry.net"},
    {".prod",                      "domain-registry-whois.l.google.com"},
    {".productions",               "whois.donuts.co"},
    {".prof",                      "domain-registry-whois.l.google.com"},
    {".properties",                "whois.donuts.co"},
    {".property",                  "whois.uniregistry.net"},
    {".ps",                        nullptr},
    {".pt",                        "whois.dns.pt"},
    {".pub",                       "whois.unitedtld.com"},
    {".pw",                        "whois.nic.pw"},
    {".py",                        nullptr},
    {".qa",                        "whois.registry.qa"},
    {".qpon",                      nullptr},
    {".quebec",                    "whois.quebec.rs.corenic.net"},
    {".re",                        "whois.nic.re"},
    {".realtor",                   nullptr},
    {".recipes",                   "whois.donuts.co"},
    {".red",                       "whois.afilias.net"},
    {".rehab",                     "whois.rightside.co"},
    {".reise",                     "whois.nic.reise"},
    {".reisen",                    "whois.donuts.co"},
    {".ren",                       nullptr},
    {".rentals",                   "whois.donuts.co"},
    {".repair",                    "whois.donuts.co"},
    {".report",                    "whois.donuts.co"},
    {".republican",                "whois.rightside.co"},
    {".rest",                      "whois.centralnic.com"},
    {".restaurant",                "whois.donuts.co"},
    {".reviews",                   "whois.unitedtld.com"},
    {".rich",                      "whois.afilias-srs.net"},
    {".rio",                       "whois.gtlds.nic.br"},
    {".ro",                        "whois.rotld.ro"},
    {".rocks",                     "whois.unitedtld.com"},
    {".rodeo",                     "whois-dub.mm-registry.com"},
    {".rs",                        "whois.rnids.rs"},
    {".rsvp",                      "domain-registry-whois.l.google.com"},
    {".ru",                        "whois.tcinet.ru"},
    {".ruhr",                      "whois.nic.ruhr"},
    {".rw",                        nullptr},
    {".ryukyu",                    nullptr},
    {".sa",                        "whois.nic.net.sa"},
    {".saarland",                  "whois.ksregistry.net"},
    {".sarl",                      "whois.donuts.co"},
    {".sb",                        "whois.nic.net.sb"},
    {".sc",                        "whois2.afilias-grs.net"},
    {".sca",                       "whois.nic.sca"},
    {".scb",                       "whois.nic.scb"},
    {".schmidt",                   "whois.nic.schmidt"},
    {".schule",                    "whois.donuts.co"},
    {".scot",                      "whois.scot.coreregistry.net"},
    {".sd",                        nullptr},
    {".se",                        "whois.iis.se"},
    {".services",                  "whois.donuts.co"},
    {".sexy",                      "whois.uniregistry.net"},
    {".sg",                        "whois.sgnic.sg"},
    {".sh",                        "whois.nic.sh"},
    {".shiksha",                   "whois.afilias.net"},
    {".shoes",                     "whois.donuts.co"},
    {".si",                        "whois.arnes.si"},
    {".singles",                   "whois.donuts.co"},
    {".sj",                        nullptr},
    {".sk",                        "whois.sk-nic.sk"},
    {".sl",                        nullptr},
    {".sm",                        "whois.nic.sm"},
    {".sn",                        "whois.nic.sn"},
    {".so",                        "whois.nic.so"},
    {".social",                    "whois.unitedtld.com"},
    {".software",                  "whois.rightside.co"},
    {".sohu",                      nullptr},
    {".solar",                     "whois.donuts.co"},
    {".solutions",                 "whois.donuts.co"},
    {".soy",                       "domain-registry-whois.l.google.com"},
    {".space",                     "whois.nic.space"},
    {".spiegel",                   "whois.ksregistry.net"},
    {".sr",                        nullptr},
    {".ss",                        nullptr},
    {".st",                        "whois.nic.st"},
    {".su",                        "whois.tcinet.ru"},
    {".supplies",                  "whois.donuts.co"},
    {".supply",                    "whois.donuts.co"},
    {".support",                   "whois.donuts.co"},
    {".surf",                      "whois-dub.mm-registry.com"},
    {".surgery",                   "whois.donuts.co"},
    {".suzuki",                    nullptr},
    {".sv",                        nullptr},
    {".sx",                        "whois.sx"},
    {".sy",                        "whois.tld.sy"},
    {".systems",                   "whois.donuts.co"},
    {".sz",                        nullptr},
    {".tatar",                     "whois.nic.tatar"},
    {".tattoo",                    "whois.uniregistry.net"},
    {".tax",                       "whois.donuts.co"},
    {".tc",                        "whois.meridiantld.net"},
    {".td",                        nullptr},
    {".technology",                "whois.donuts.co"},
    {".tel",                       "whois.nic.tel"},
    {".tf",                        "whois.nic.tf"},
    {".tg",                        nullptr},
    {".th",                        "whois.thnic.co.th"},
    {".tienda",                    "whois.donuts.co"},
    {".tips",                      "whois.donuts.co"},
    {".tirol",                     "whois.nic.tirol"},
    {".tj",                        nullptr},
    {".tk",                        "whois.dot.tk"},
    {".tl",                        "whois.nic.tl"},
    {".tm",                        "whois.nic.tm"},
    {".tn",                        "whois.ati.tn"},
    {".to",                        "whois.tonic.to"},
    {".today",                     "whois.donuts.co"},
    {".tokyo",                     nullptr},
    {".tools",                     "whois.donuts.co"},
    {".top",                       "whois.nic.top"},
    {".town",                      "whois.donuts.co"},
    {".toys",                      "whois.donuts.co"},
    {".tp",                        nullptr},
    {".tr",                        "whois.nic.tr"},
    {".trade",                     nullptr},
    {".training",                  "whois.donuts.co"},
    {".travel",                    "whois.nic.travel"},
    {".tt",                        nullptr},
    {".tui",                       "whois.ksregistry.net"},
    {".tv",                        "tvwhois.verisign-grs.com"},
    {".tw",                        "whois.twnic.net.tw"},
    {".tz",                        "whois.tznic.or.tz"},
    {".ua",                        "whois.ua"},
    {".ug",                        "whois.co.ug"},
    {".uk",                        "whois.nic.uk"},
    {".um",                        nullptr},
    {".university",                "whois.donuts.co"},
    {".uno",                       nullptr},
    {".uol",                       "whois.gtlds.nic.br"},
    {".us",                        "whois.nic.us"},
    {".uy",                        "whois.nic.org.uy"},
    {".uz",                        "whois.cctld.uz"},
    {".va",                        nullptr},
    {".vacations",                 "whois.donuts.co"},
    {".vc",                        "whois2.afilias-grs.net"},
    {".ve",                        "whois.nic.ve"},
    {".vegas",                     "whois.afilias-srs.net"},
    {".ventures",                  "whois.donuts.co"},
    {".versicherung",              "whois.nic.versicherung"},
    {".vet",                       "whois.rightside.co"},
    {".vg",                        "ccwhois.ksregistry.net"},
    {".vi",                        nullptr},
    {".viajes",                    "whois.donuts.co"},
    {".villas",                    "whois.donuts.co"},
    {".vision",                    "whois.donuts.co"},
    {".vlaanderen",                "whois.nic.vlaanderen"},
    {".vn",                        nullptr},
    {".vodka",                     "whois-dub.mm-registry.com"},
    {".vote",                      "whois.afilias.net"},
    {".voting",                    "whois.voting.tld-box.at"},
    {".voto",                      "whois.afilias.net"},
    {".voyage",                    "whois.donuts.co"},
    {".vu",                        "vunic.vu"},
    {".wales",                     "whois.nic.wales"},
    {".wang",                      "whois.gtld.knet.cn"},
    {".watch",                     "whois.donuts.co"},
    {".webcam",                    nullptr},
    {".website",                   "whois.nic.website"},
    {".wed",                       "whois.nic.wed"},
    {".wf",                        "whois.nic.wf"},
    {".whoswho",                   nullptr},
    {".wien",                      "whois.nic.wien"},
    {".wiki",                      "whois.nic.wiki"},
    {".williamhill",               nullptr},
    {".wme",                       "whois.centralnic.com"},
    {".work",                      "whois-dub.mm-registry.com"},
    {".works",                     "whois.donuts.co"},
    {".world",                     "whois.donuts.co"},
    {".ws",                        "whois.website.ws"},
    {".wtc",                       "whois.nic.wtc"},
    {".wtf",                       "whois.donuts.co"},
    {".xn--0zwm56d",               nullptr},
    {".xn--11b5bs3a9aj6g",         nullptr},
    {".xn--1qqw23a",               "whois.ngtld.cn"},
    {".xn--3bst00m",               "whois.gtld.knet.cn"},
    {".xn--3ds443g",               "whois.afilias-srs.net"},
    {".xn--3e0b707e",              "whois.kr"},
    {".xn--45brj9c",               nullptr},
    {".xn--4gbrim",                "whois.afilias-srs.net"},
    {".xn--54b7fta0cc",            nullptr},
    {".xn--55qw42g",               "whois.conac.cn"},
    {".xn--55qx5d",                "whois.ngtld.cn"},
    {".xn--6frz82g",               "whois.afilias.net"},
    {".xn--6qq986b3xl",            "whois.gtld.knet.cn"},
    {".xn--80adxhks",              "whois.nic.xn--80adxhks"},
    {".xn--80akhbyknj4f",          nullptr},
    {".xn--80ao21a",               "whois.nic.kz"},
    {".xn--80asehdb",              "whois.online.rs.corenic.net"},
    {".xn--80aswg",                "whois.site.rs.corenic.net"},
    {".xn--90a3ac",                nullptr},
    {".xn--90ais",                 nullptr},
    {".xn--9t4b11yi5a",            nullptr},
    {".xn--c1avg",                 "whois.publicinterestregistry.net"},
    {".xn--cg4bki",                "whois.kr"},
    {".xn--clchc0ea0b2g2a9gcd",    "whois.sgnic.sg"},
    {".xn--czr694b",               nullptr},
    {".xn--czru2d",                "whois.gtld.knet.cn"},
    {".xn--d1acj3b",               "whois.nic.xn--d1acj3b"},
    {".xn--d1alf",                 nullptr},
    {".xn--deba0ad",               nullptr},
    {".xn--fiq228c5hs",            "whois.afilias-srs.net"},
    {".xn--fiq64b",                "whois.gtld.knet.cn"},
    {".xn--fiqs8s",                "cwhois.cnnic.cn"},
    {".xn--fiqz9s",                "cwhois.cnnic.cn"},
    {".xn--fpcrj9c3d",             nullptr},
    {".xn--fzc2c9e2c",             nullptr},
    {".xn--g6w251d",               nullptr},
    {".xn--gecrj9c",               nullptr},
    {".xn--h2brj9c",               nullptr},
    {".xn--hgbk6aj7f53bba",        nullptr},
    {".xn--hlcj6aya9esc7a",        nullptr},
    {".xn--i1b6b1a6a2e",           "whois.publicinterestregistry.net"},
    {".xn--io0a7i",                "whois.ngtld.cn"},
    {".xn--j1amh",                 "whois.dotukr.com"},
    {".xn--j6w193g",               "whois.hkirc.hk"},
    {".xn--jxalpdlp",              nullptr},
    {".xn--kgbechtv",              nullptr},
    {".xn--kprw13d",               "whois.twnic.net.tw"},
    {".xn--kpry57d",               "whois.twnic.net.tw"},
    {".xn--kput3i",                "whois.afilias-srs.net"},
    {".xn--l1acc",                 nullptr},
    {".xn--lgbbat1ad8j",           "whois.nic.dz"},
    {".xn--mgb9awbf",              "whois.registry.om"},
    {".xn--mgba3a4f16a",           "whois.nic.ir"},
    {".xn--mgbaam7a8h",            "whois.aeda.net.ae"},
    {".xn--mgbab2bd",              "whois.bazaar.coreregistry.net"},
    {".xn--mgbai9azgqp6j",         nullptr},
    {".xn--mgbayh7gpa",            nullptr},
    {".xn--mgbbh1a71e",            nullptr},
    {".xn--mgbc0a9azcg",           nullptr},
    {".xn--mgberp4a5d4ar",         "whois.nic.net.sa"},
    {".xn--mgbpl2fh",              nullptr},
    {".xn--mgbtx2b",               nullptr},
    {".xn--mgbx4cd0ab",            "whois.mynic.my"},
    {".xn--ngbc5azd",              "whois.nic.xn--ngbc5azd"},
    {".xn--node",                  nullptr},
    {".xn--nqv7f",                 "whois.publicinterestregistry.net"},
    {".xn--nqv7fs00ema",           "whois.publicinterestregistry.net"},
    {".xn--o3cw4h",                "whois.thnic.co.th"},
    {".xn--ogbpf8fl",              "whois.tld.sy"},
    {".xn--p1acf",                 "whois.nic.xn--p1acf"},
    {".xn--p1ai",                  "whois.tcinet.ru"},
    {".xn--pgbs0dh",               nullptr},
    {".xn--q9jyb4c",               "domain-registry-whois.l.google.com"},
    {".xn--rhqv96g",               nullptr},
    {".xn--s9brj9c",               nullptr},
    {".xn--ses554g",               nullptr},
    {".xn--unup4y",                "whois.donuts.co"},
    {".xn--vermgensberater-ctb",   "whois.ksregistry.net"},
    {".xn--vermgensberatung-pwb",  "whois.ksregistry.net"},
    {".xn--vhquv",                 "whois.donuts.co"},
    {".xn--wgbh1c",                nullptr},
    {".xn--wgbl6a",                "whois.registry.qa"},
    {".xn--xhq521b",               "whois.ngtld.cn"},
    {".xn--xkc2al3hye2a",          nullptr},
    {".xn--xkc2dl3a5ee0h",         nullptr},
    {".xn--yfro4i67o",             "whois.sgnic.sg"},
    {".xn--ygbi2ammx",             "whois.pnina.ps"},
    {".xn--zckzah",                nullptr},
    {".xn--zfr164b",               "whois.conac.cn"},
    {".xxx",                       "whois.nic.xxx"},
    {".xyz",                       "whois.nic.xyz"},
    {".yachts",                    "whois.afilias-srs.net"},
    {".yandex",                    nullptr},
    {".ye",                        nullptr},
    {".yokohama",                  nullptr},
    {".youtube",                   "domain-registry-whois.l.google.com"},
    {".yt",                        "whois.nic.yt"},
    {".za",                        nullptr},
    {".zip",                       "domain-registry-whois.l.google.com"},
    {".zm",                        "whois.nic.zm"},
    {".zone",                      "whois.donuts.co"},
    {".zw",                        nullptr},
};
// clang-format on
} // namespace

namespace WHOIS {

Registry const& Registry::root_zone()
{
  static Registry const db = [] {
    Registry reg;
    for (auto const& z : root_zone_db) {
      if (z.server)
        reg.insert_(z.suffix, std::string{z.server});
      else
        reg.insert_(z.suffix, std::nullopt);
    }
    LOG(INFO) << "root zone registry has " << reg.size() << " entries";
    return reg;
  }();
  return db;
}

} // namespace WHOIS

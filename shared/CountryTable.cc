// Copyright 2013 Viewfinder. All rights reserved.

#include "CountryTable.h"

namespace {

#define COUNTRY(name, code, prefix, lengths)            \
  { name, code, prefix, lengths, ARRAYSIZE(lengths) }

const int kLengths4[] = { 4 };
const int kLengths4_5[] = { 4, 5 };
const int kLengths5[] = { 5 };
const int kLengths5_6[] = { 5, 6 };
const int kLengths5_7[] = { 5, 7 };
const int kLengths5_7_8[] = { 5, 7, 8 };
const int kLengths5_8[] = { 5, 8 };
const int kLengths6[] = { 6 };
const int kLengths6_7[] = { 6, 7 };
const int kLengths6_7_8_9_10_11[] = { 6, 7, 8, 9, 10, 11 };
const int kLengths6_8[] = { 6, 8 };
const int kLengths7[] = { 7 };
const int kLengths7_8[] = { 7, 8 };
const int kLengths7_8_9[] = { 7, 8, 9 };
const int kLengths7_9[] = { 7, 9 };
const int kLengths8[] = { 8 };
const int kLengths8_9[] = { 8, 9 };
const int kLengths8_9_10[] = { 8, 9, 10 };
const int kLengths8_10[] = { 8, 10 };
const int kLengths9[] = { 9 };
const int kLengths9_10[] = { 9, 10 };
const int kLengths9_10_11[] = { 9, 10, 11 };
const int kLengths10[] = { 10 };
const int kLengths10_11[] = { 10, 11 };
const int kLengths10_11_12_13[] = { 10, 11, 12, 13 };
const int kLengths11[] = { 11 };

// Rules are matched in order. Rules sharing a prefix must appear in
// preference order.
const CountryRule kCountryTable[] = {
  COUNTRY("United States", "US", 1, kLengths10),
  COUNTRY("Canada", "CA", 1, kLengths10),
  COUNTRY("Russia", "RU", 7, kLengths10),
  COUNTRY("Kazakhstan", "KZ", 7, kLengths10),
  COUNTRY("Egypt", "EG", 20, kLengths9_10),
  COUNTRY("South Africa", "ZA", 27, kLengths9),
  COUNTRY("Greece", "GR", 30, kLengths10),
  COUNTRY("Netherlands", "NL", 31, kLengths9),
  COUNTRY("Belgium", "BE", 32, kLengths8_9_10),
  COUNTRY("France", "FR", 33, kLengths9),
  COUNTRY("Spain", "ES", 34, kLengths9),
  COUNTRY("Hungary", "HU", 36, kLengths8_9),
  COUNTRY("Italy", "IT", 39, kLengths6_7_8_9_10_11),
  COUNTRY("Romania", "RO", 40, kLengths9),
  COUNTRY("Switzerland", "CH", 41, kLengths9),
  COUNTRY("Austria", "AT", 43, kLengths10_11_12_13),
  COUNTRY("United Kingdom", "GB", 44, kLengths10),
  COUNTRY("Great Britain - Cymru", "GB-CYM", 44, kLengths10),
  COUNTRY("Denmark", "DK", 45, kLengths8),
  COUNTRY("Sweden", "SE", 46, kLengths7_8_9),
  COUNTRY("Norway", "NO", 47, kLengths8),
  COUNTRY("Poland", "PL", 48, kLengths9),
  COUNTRY("Germany", "DE", 49, kLengths10_11),
  COUNTRY("Peru", "PE", 51, kLengths9),
  COUNTRY("Mexico", "MX", 52, kLengths10),
  COUNTRY("Cuba", "CU", 53, kLengths8),
  COUNTRY("Argentina", "AR", 54, kLengths10),
  COUNTRY("Brazil", "BR", 55, kLengths10_11),
  COUNTRY("Chile", "CL", 56, kLengths9),
  COUNTRY("Colombia", "CO", 57, kLengths10),
  COUNTRY("Venezuela", "VE", 58, kLengths10),
  COUNTRY("Malaysia", "MY", 60, kLengths9_10),
  COUNTRY("Australia", "AU", 61, kLengths9_10),
  COUNTRY("Indonesia", "ID", 62, kLengths9_10_11),
  COUNTRY("Philippines", "PH", 63, kLengths10),
  COUNTRY("New Zealand", "NZ", 64, kLengths8_9_10),
  COUNTRY("Singapore", "SG", 65, kLengths8),
  COUNTRY("Thailand", "TH", 66, kLengths9),
  COUNTRY("Japan", "JP", 81, kLengths10),
  COUNTRY("South Korea", "KR", 82, kLengths9_10),
  COUNTRY("Vietnam", "VN", 84, kLengths9_10),
  COUNTRY("China", "CN", 86, kLengths11),
  COUNTRY("Turkey", "TR", 90, kLengths10),
  COUNTRY("India", "IN", 91, kLengths10),
  COUNTRY("Pakistan", "PK", 92, kLengths10),
  COUNTRY("Afghanistan", "AF", 93, kLengths9),
  COUNTRY("Sri Lanka", "LK", 94, kLengths9),
  COUNTRY("Myanmar", "MM", 95, kLengths8_9_10),
  COUNTRY("Iran", "IR", 98, kLengths10),
  COUNTRY("Morocco", "MA", 212, kLengths9),
  COUNTRY("Algeria", "DZ", 213, kLengths9),
  COUNTRY("Tunisia", "TN", 216, kLengths8),
  COUNTRY("Libya", "LY", 218, kLengths9),
  COUNTRY("Gambia", "GM", 220, kLengths7),
  COUNTRY("Senegal", "SN", 221, kLengths9),
  COUNTRY("Mauritania", "MR", 222, kLengths8),
  COUNTRY("Mali", "ML", 223, kLengths8),
  COUNTRY("Guinea", "GN", 224, kLengths9),
  COUNTRY("Ivory Coast", "CI", 225, kLengths8_10),
  COUNTRY("Burkina Faso", "BF", 226, kLengths8),
  COUNTRY("Niger", "NE", 227, kLengths8),
  COUNTRY("Togo", "TG", 228, kLengths8),
  COUNTRY("Benin", "BJ", 229, kLengths8),
  COUNTRY("Mauritius", "MU", 230, kLengths7_8),
  COUNTRY("Liberia", "LR", 231, kLengths8_9),
  COUNTRY("Sierra Leone", "SL", 232, kLengths8),
  COUNTRY("Ghana", "GH", 233, kLengths9),
  COUNTRY("Nigeria", "NG", 234, kLengths8_9_10),
  COUNTRY("Chad", "TD", 235, kLengths8),
  COUNTRY("Central African Republic", "CF", 236, kLengths8),
  COUNTRY("Cameroon", "CM", 237, kLengths9),
  COUNTRY("Cape Verde", "CV", 238, kLengths7),
  COUNTRY("Sao Tome and Principe", "ST", 239, kLengths7),
  COUNTRY("Equatorial Guinea", "GQ", 240, kLengths9),
  COUNTRY("Gabon", "GA", 241, kLengths7_8),
  COUNTRY("Republic of the Congo", "CG", 242, kLengths9),
  COUNTRY("Democratic Republic of the Congo", "CD", 243, kLengths9),
  COUNTRY("Angola", "AO", 244, kLengths9),
  COUNTRY("Guinea-Bissau", "GW", 245, kLengths7_9),
  COUNTRY("British Indian Ocean Territory", "IO", 246, kLengths7),
  COUNTRY("Ascension Island", "AC", 247, kLengths4_5),
  COUNTRY("Seychelles", "SC", 248, kLengths7),
  COUNTRY("Sudan", "SD", 249, kLengths9),
  COUNTRY("Rwanda", "RW", 250, kLengths9),
  COUNTRY("Ethiopia", "ET", 251, kLengths9),
  COUNTRY("Somalia", "SO", 252, kLengths8_9),
  COUNTRY("Djibouti", "DJ", 253, kLengths8),
  COUNTRY("Kenya", "KE", 254, kLengths9_10),
  COUNTRY("Tanzania", "TZ", 255, kLengths9),
  COUNTRY("Uganda", "UG", 256, kLengths9),
  COUNTRY("Burundi", "BI", 257, kLengths8),
  COUNTRY("Mozambique", "MZ", 258, kLengths8_9),
  COUNTRY("Zambia", "ZM", 260, kLengths9),
  COUNTRY("Madagascar", "MG", 261, kLengths9),
  COUNTRY("Reunion", "RE", 262, kLengths9),
  COUNTRY("Zimbabwe", "ZW", 263, kLengths9),
  COUNTRY("Namibia", "NA", 264, kLengths8_9),
  COUNTRY("Malawi", "MW", 265, kLengths7_9),
  COUNTRY("Lesotho", "LS", 266, kLengths8),
  COUNTRY("Botswana", "BW", 267, kLengths7_8),
  COUNTRY("Eswatini", "SZ", 268, kLengths8),
  COUNTRY("Comoros", "KM", 269, kLengths7),
  COUNTRY("Saint Helena", "SH", 290, kLengths4_5),
  COUNTRY("Eritrea", "ER", 291, kLengths7),
  COUNTRY("Aruba", "AW", 297, kLengths7),
  COUNTRY("Faroe Islands", "FO", 298, kLengths6),
  COUNTRY("Greenland", "GL", 299, kLengths6),
  COUNTRY("Gibraltar", "GI", 350, kLengths8),
  COUNTRY("Portugal", "PT", 351, kLengths9),
  COUNTRY("Luxembourg", "LU", 352, kLengths8_9),
  COUNTRY("Ireland", "IE", 353, kLengths7_8_9),
  COUNTRY("Iceland", "IS", 354, kLengths7),
  COUNTRY("Albania", "AL", 355, kLengths8_9),
  COUNTRY("Malta", "MT", 356, kLengths8),
  COUNTRY("Cyprus", "CY", 357, kLengths8),
  COUNTRY("Finland", "FI", 358, kLengths9_10),
  COUNTRY("Bulgaria", "BG", 359, kLengths8_9),
  COUNTRY("Lithuania", "LT", 370, kLengths8),
  COUNTRY("Latvia", "LV", 371, kLengths8),
  COUNTRY("Estonia", "EE", 372, kLengths7_8),
  COUNTRY("Moldova", "MD", 373, kLengths8),
  COUNTRY("Armenia", "AM", 374, kLengths8),
  COUNTRY("Belarus", "BY", 375, kLengths9),
  COUNTRY("Andorra", "AD", 376, kLengths6),
  COUNTRY("Monaco", "MC", 377, kLengths8_9),
  COUNTRY("San Marino", "SM", 378, kLengths9_10),
  COUNTRY("Vatican City", "VA", 379, kLengths9_10),
  COUNTRY("Ukraine", "UA", 380, kLengths9),
  COUNTRY("Serbia", "RS", 381, kLengths8_9),
  COUNTRY("Montenegro", "ME", 382, kLengths8),
  COUNTRY("Kosovo", "XK", 383, kLengths8),
  COUNTRY("Croatia", "HR", 385, kLengths8_9),
  COUNTRY("Slovenia", "SI", 386, kLengths8),
  COUNTRY("Bosnia and Herzegovina", "BA", 387, kLengths8),
  COUNTRY("North Macedonia", "MK", 389, kLengths8),
  COUNTRY("Czech Republic", "CZ", 420, kLengths9),
  COUNTRY("Slovakia", "SK", 421, kLengths9),
  COUNTRY("Liechtenstein", "LI", 423, kLengths7),
  COUNTRY("Falkland Islands", "FK", 500, kLengths5),
  COUNTRY("Belize", "BZ", 501, kLengths7),
  COUNTRY("Guatemala", "GT", 502, kLengths8),
  COUNTRY("El Salvador", "SV", 503, kLengths8),
  COUNTRY("Honduras", "HN", 504, kLengths8),
  COUNTRY("Nicaragua", "NI", 505, kLengths8),
  COUNTRY("Costa Rica", "CR", 506, kLengths8),
  COUNTRY("Panama", "PA", 507, kLengths7_8),
  COUNTRY("Saint Pierre and Miquelon", "PM", 508, kLengths6_8),
  COUNTRY("Haiti", "HT", 509, kLengths8),
  COUNTRY("Guadeloupe", "GP", 590, kLengths9),
  COUNTRY("Bolivia", "BO", 591, kLengths8),
  COUNTRY("Guyana", "GY", 592, kLengths7),
  COUNTRY("Ecuador", "EC", 593, kLengths8_9),
  COUNTRY("French Guiana", "GF", 594, kLengths9),
  COUNTRY("Paraguay", "PY", 595, kLengths9),
  COUNTRY("Martinique", "MQ", 596, kLengths9),
  COUNTRY("Suriname", "SR", 597, kLengths6_7),
  COUNTRY("Uruguay", "UY", 598, kLengths8),
  COUNTRY("Curacao", "CW", 599, kLengths7_8),
  COUNTRY("Timor-Leste", "TL", 670, kLengths7_8),
  COUNTRY("Norfolk Island", "NF", 672, kLengths6),
  COUNTRY("Brunei", "BN", 673, kLengths7),
  COUNTRY("Nauru", "NR", 674, kLengths7),
  COUNTRY("Papua New Guinea", "PG", 675, kLengths8),
  COUNTRY("Tonga", "TO", 676, kLengths5_7_8),
  COUNTRY("Solomon Islands", "SB", 677, kLengths5_7),
  COUNTRY("Vanuatu", "VU", 678, kLengths5_7),
  COUNTRY("Fiji", "FJ", 679, kLengths7),
  COUNTRY("Palau", "PW", 680, kLengths7),
  COUNTRY("Wallis and Futuna", "WF", 681, kLengths6),
  COUNTRY("Cook Islands", "CK", 682, kLengths5),
  COUNTRY("Kiribati", "KI", 686, kLengths5_8),
  COUNTRY("New Caledonia", "NC", 687, kLengths6),
  COUNTRY("Tuvalu", "TV", 688, kLengths5_6),
  COUNTRY("French Polynesia", "PF", 689, kLengths8),
  COUNTRY("Tokelau", "TK", 690, kLengths4),
  COUNTRY("Micronesia", "FM", 691, kLengths7),
  COUNTRY("Marshall Islands", "MH", 692, kLengths7),
  COUNTRY("North Korea", "KP", 850, kLengths8_10),
  COUNTRY("Hong Kong", "HK", 852, kLengths8),
  COUNTRY("Macau", "MO", 853, kLengths8),
  COUNTRY("Cambodia", "KH", 855, kLengths8_9),
  COUNTRY("Laos", "LA", 856, kLengths8_9_10),
  COUNTRY("Bangladesh", "BD", 880, kLengths10),
  COUNTRY("Taiwan", "TW", 886, kLengths9),
  COUNTRY("Maldives", "MV", 960, kLengths7),
  COUNTRY("Lebanon", "LB", 961, kLengths7_8),
  COUNTRY("Jordan", "JO", 962, kLengths9),
  COUNTRY("Syria", "SY", 963, kLengths9),
  COUNTRY("Iraq", "IQ", 964, kLengths10),
  COUNTRY("Kuwait", "KW", 965, kLengths8),
  COUNTRY("Saudi Arabia", "SA", 966, kLengths9),
  COUNTRY("Yemen", "YE", 967, kLengths9),
  COUNTRY("Oman", "OM", 968, kLengths8),
  COUNTRY("Palestine", "PS", 970, kLengths9),
  COUNTRY("United Arab Emirates", "AE", 971, kLengths9),
  COUNTRY("Israel", "IL", 972, kLengths9),
  COUNTRY("Bahrain", "BH", 973, kLengths8),
  COUNTRY("Qatar", "QA", 974, kLengths8),
  COUNTRY("Bhutan", "BT", 975, kLengths8),
  COUNTRY("Mongolia", "MN", 976, kLengths8),
  COUNTRY("Nepal", "NP", 977, kLengths10),
  COUNTRY("Tajikistan", "TJ", 992, kLengths9),
  COUNTRY("Turkmenistan", "TM", 993, kLengths8_9),
  COUNTRY("Azerbaijan", "AZ", 994, kLengths9),
  COUNTRY("Georgia", "GE", 995, kLengths9),
  COUNTRY("Kyrgyzstan", "KG", 996, kLengths9),
  COUNTRY("Uzbekistan", "UZ", 998, kLengths9),
};

#undef COUNTRY

}  // namespace

bool CountryRule::AcceptsLength(int n) const {
  for (int i = 0; i < num_lengths; ++i) {
    if (lengths[i] == n) {
      return true;
    }
  }
  return false;
}

ostream& operator<<(ostream& os, const CountryRule& rule) {
  return os << rule.code << " (+" << rule.prefix << ")";
}

int CountDigits(int n) {
  int digits = 1;
  while (n >= 10) {
    n /= 10;
    ++digits;
  }
  return digits;
}

const CountryRule* CountryTable() {
  return kCountryTable;
}

int CountryTableSize() {
  return ARRAYSIZE(kCountryTable);
}

const CountryRule* FindCountryByCode(const Slice& code) {
  for (int i = 0; i < ARRAYSIZE(kCountryTable); ++i) {
    if (code == kCountryTable[i].code) {
      return &kCountryTable[i];
    }
  }
  return NULL;
}

vector<const CountryRule*> FindCountriesByPrefix(int prefix) {
  vector<const CountryRule*> rules;
  for (int i = 0; i < ARRAYSIZE(kCountryTable); ++i) {
    if (kCountryTable[i].prefix == prefix) {
      rules.push_back(&kCountryTable[i]);
    }
  }
  return rules;
}

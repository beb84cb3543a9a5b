/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4/SDP4 Satellite Propagation Implementation
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#include <skywatch/sgp4.hpp>

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace skywatch::sgp4 {

namespace {

// Earth rotation rate used by the resonance terms (rad/min)
constexpr double RPTIM = 4.37526908801129966e-3;

// Third-body constants
constexpr double ZES = 0.01675;        // Solar eccentricity
constexpr double ZEL = 0.05490;        // Lunar eccentricity
constexpr double ZNS = 1.19459e-5;     // Solar mean motion (rad/min)
constexpr double ZNL = 1.5835218e-4;   // Lunar mean motion (rad/min)
constexpr double C1SS = 2.9864797e-6;
constexpr double C1L = 4.7968065e-7;

// Resonance integrator step (minutes)
constexpr double STEPP = 720.0;
constexpr double STEPN = -720.0;
constexpr double STEP2 = 259200.0;

// Geopotential resonance constants
constexpr double Q22 = 1.7891679e-6;
constexpr double Q31 = 2.1460748e-6;
constexpr double Q33 = 2.2123015e-7;
constexpr double ROOT22 = 1.7891679e-6;
constexpr double ROOT44 = 7.3636953e-9;
constexpr double ROOT54 = 2.1765803e-9;
constexpr double ROOT32 = 3.7393792e-7;
constexpr double ROOT52 = 1.1428639e-7;
constexpr double FASX2 = 0.13130908;
constexpr double FASX4 = 2.8843198;
constexpr double FASX6 = 0.37448087;
constexpr double G22 = 5.7686396;
constexpr double G32 = 0.95240898;
constexpr double G44 = 1.8014998;
constexpr double G52 = 1.0508330;
constexpr double G54 = 4.4108898;

/**
 * Orientation of a perturbing body's orbit.
 */
struct BodyOrientation {
    double cosg, sing;   // Argument of perigee
    double cosi, sini;   // Inclination
    double cosh, sinh;   // Node, relative to the satellite's
};

/**
 * Geometry of one perturbing body relative to the satellite orbit.
 */
struct BodyTerms {
    double s1, s2, s3, s4, s5, s6, s7;
    double z1, z2, z3;
    double z11, z12, z13;
    double z21, z22, z23;
    double z31, z32, z33;
};

BodyTerms computeBodyTerms(const BodyOrientation& body, double cc, double nm, double em,
                           double sinim, double cosim, double sinomm, double cosomm) {
    double emsq = em * em;
    double betasq = 1.0 - emsq;
    double rtemsq = std::sqrt(betasq);

    double a1 = body.cosg * body.cosh + body.sing * body.cosi * body.sinh;
    double a3 = -body.sing * body.cosh + body.cosg * body.cosi * body.sinh;
    double a7 = -body.cosg * body.sinh + body.sing * body.cosi * body.cosh;
    double a8 = body.sing * body.sini;
    double a9 = body.sing * body.sinh + body.cosg * body.cosi * body.cosh;
    double a10 = body.cosg * body.sini;
    double a2 = cosim * a7 + sinim * a8;
    double a4 = cosim * a9 + sinim * a10;
    double a5 = -sinim * a7 + cosim * a8;
    double a6 = -sinim * a9 + cosim * a10;

    double x1 = a1 * cosomm + a2 * sinomm;
    double x2 = a3 * cosomm + a4 * sinomm;
    double x3 = -a1 * sinomm + a2 * cosomm;
    double x4 = -a3 * sinomm + a4 * cosomm;
    double x5 = a5 * sinomm;
    double x6 = a6 * sinomm;
    double x7 = a5 * cosomm;
    double x8 = a6 * cosomm;

    BodyTerms t;
    t.z31 = 12.0 * x1 * x1 - 3.0 * x3 * x3;
    t.z32 = 24.0 * x1 * x2 - 6.0 * x3 * x4;
    t.z33 = 12.0 * x2 * x2 - 3.0 * x4 * x4;
    t.z1 = 3.0 * (a1 * a1 + a2 * a2) + t.z31 * emsq;
    t.z2 = 6.0 * (a1 * a3 + a2 * a4) + t.z32 * emsq;
    t.z3 = 3.0 * (a3 * a3 + a4 * a4) + t.z33 * emsq;
    t.z11 = -6.0 * a1 * a5 + emsq * (-24.0 * x1 * x7 - 6.0 * x3 * x5);
    t.z12 = -6.0 * (a1 * a6 + a3 * a5) + emsq * (-24.0 * (x2 * x7 + x1 * x8) - 6.0 * (x3 * x6 + x4 * x5));
    t.z13 = -6.0 * a3 * a6 + emsq * (-24.0 * x2 * x8 - 6.0 * x4 * x6);
    t.z21 = 6.0 * a2 * a5 + emsq * (24.0 * x1 * x5 - 6.0 * x3 * x7);
    t.z22 = 6.0 * (a4 * a5 + a2 * a6) + emsq * (24.0 * (x2 * x5 + x1 * x6) - 6.0 * (x4 * x7 + x3 * x8));
    t.z23 = 6.0 * a4 * a6 + emsq * (24.0 * x2 * x6 - 6.0 * x4 * x8);
    t.z1 = t.z1 + t.z1 + betasq * t.z31;
    t.z2 = t.z2 + t.z2 + betasq * t.z32;
    t.z3 = t.z3 + t.z3 + betasq * t.z33;

    t.s3 = cc / nm;
    t.s2 = -0.5 * t.s3 / rtemsq;
    t.s4 = t.s3 * rtemsq;
    t.s1 = -15.0 * em * t.s4;
    t.s5 = x1 * x3 + x2 * x4;
    t.s6 = x2 * x3 + x1 * x4;
    t.s7 = x2 * x4 - x1 * x3;
    return t;
}

PeriodicTerms computePeriodicTerms(const BodyTerms& b, double ze, double emsq) {
    PeriodicTerms p;
    p.e2 = 2.0 * b.s1 * b.s6;
    p.e3 = 2.0 * b.s1 * b.s7;
    p.i2 = 2.0 * b.s2 * b.z12;
    p.i3 = 2.0 * b.s2 * (b.z13 - b.z11);
    p.l2 = -2.0 * b.s3 * b.z2;
    p.l3 = -2.0 * b.s3 * (b.z3 - b.z1);
    p.l4 = -2.0 * b.s3 * (-21.0 - 9.0 * emsq) * ze;
    p.gh2 = 2.0 * b.s4 * b.z32;
    p.gh3 = 2.0 * b.s4 * (b.z33 - b.z31);
    p.gh4 = -18.0 * b.s4 * ze;
    p.h2 = -2.0 * b.s2 * b.z22;
    p.h3 = -2.0 * b.s2 * (b.z23 - b.z21);
    return p;
}

/**
 * Periodic contribution of one body at a given mean anomaly of that body.
 */
struct Perturbation {
    double e, i, l, gh, h;
};

Perturbation evaluatePeriodicTerms(const PeriodicTerms& p, double zm, double ze) {
    double zf = zm + 2.0 * ze * std::sin(zm);
    double sinzf = std::sin(zf);
    double f2 = 0.5 * sinzf * sinzf - 0.25;
    double f3 = -0.5 * sinzf * std::cos(zf);
    return {
        p.e2 * f2 + p.e3 * f3,
        p.i2 * f2 + p.i3 * f3,
        p.l2 * f2 + p.l3 * f3 + p.l4 * sinzf,
        p.gh2 * f2 + p.gh3 * f3 + p.gh4 * sinzf,
        p.h2 * f2 + p.h3 * f3
    };
}

} // namespace

// Compute Greenwich Sidereal Time (IAU 1982)
double gstime(double jdut1) {
    double tut1 = (jdut1 - 2451545.0) / 36525.0;
    double temp = -6.2e-6 * tut1 * tut1 * tut1
                  + 0.093104 * tut1 * tut1
                  + (876600.0 * 3600 + 8640184.812866) * tut1
                  + 67310.54841;
    constexpr double DEG_TO_RAD = M_PI / 180.0;
    temp = std::fmod(temp * DEG_TO_RAD / 240.0, TWO_PI);
    if (temp < 0.0) temp += TWO_PI;
    return temp;
}

// ============================================================================
// Initialization
// ============================================================================

Model::Model(const Elements& elements)
    : epochJD(elements.epochJD),
      bstar(elements.bstar),
      ecco(elements.eccentricity),
      inclo(elements.inclination),
      nodeo(elements.raan),
      argpo(elements.argPerigee),
      mo(elements.meanAnomaly) {
    if (!(ecco >= 0.0 && ecco < 1.0)) {
        throw InvalidOrbitException(fmt::format("Eccentricity out of range: {}", ecco));
    }
    if (!(elements.meanMotion > 0.0)) {
        throw InvalidOrbitException(fmt::format("Mean motion is not positive: {}", elements.meanMotion));
    }

    // Recover the Brouwer mean motion from the Kozai mean motion
    double eccsq = ecco * ecco;
    double omeosq = 1.0 - eccsq;
    double rteosq = std::sqrt(omeosq);
    double cosio = std::cos(inclo);
    double sinio = std::sin(inclo);
    double cosio2 = cosio * cosio;

    double ak = std::pow(XKE / elements.meanMotion, X2O3);
    double d1 = 0.75 * J2 * (3.0 * cosio2 - 1.0) / (rteosq * omeosq);
    double del = d1 / (ak * ak);
    double adel = ak * (1.0 - del * del - del * (1.0 / 3.0 + 134.0 * del * del / 81.0));
    del = d1 / (adel * adel);
    noUnkozai = elements.meanMotion / (1.0 + del);

    double ao = std::pow(XKE / noUnkozai, X2O3);
    double po = ao * omeosq;
    double con42 = 1.0 - 5.0 * cosio2;
    double posq = po * po;
    double rp = ao * (1.0 - ecco);
    gsto = gstime(epochJD);

    near.a = ao;
    near.con41 = -con42 - cosio2 - cosio2;

    if (rp < 1.0) {
        throw SatelliteDecayedException();
    }

    near.simpleDrag = rp < (220.0 / RADIUS_EARTH_KM + 1.0);

    // Atmospheric density parameters, adjusted for low perigees
    double sfour = 78.0 / RADIUS_EARTH_KM + 1.0;
    double qzms24 = std::pow((120.0 - 78.0) / RADIUS_EARTH_KM, 4);
    double perige = (rp - 1.0) * RADIUS_EARTH_KM;
    if (perige < 156.0) {
        sfour = perige - 78.0;
        if (perige < 98.0) {
            sfour = 20.0;
        }
        qzms24 = std::pow((120.0 - sfour) / RADIUS_EARTH_KM, 4);
        sfour = sfour / RADIUS_EARTH_KM + 1.0;
    }

    double pinvsq = 1.0 / posq;
    double tsi = 1.0 / (ao - sfour);
    near.eta = ao * ecco * tsi;
    double etasq = near.eta * near.eta;
    double eeta = ecco * near.eta;
    double psisq = std::fabs(1.0 - etasq);
    double coef = qzms24 * std::pow(tsi, 4);
    double coef1 = coef / std::pow(psisq, 3.5);
    double cc2 = coef1 * noUnkozai * (ao * (1.0 + 1.5 * etasq + eeta * (4.0 + etasq))
                 + 0.375 * J2 * tsi / psisq * near.con41 * (8.0 + 3.0 * etasq * (8.0 + etasq)));
    near.cc1 = bstar * cc2;
    double cc3 = 0.0;
    if (ecco > 1.0e-4) {
        cc3 = -2.0 * coef * tsi * J3OJ2 * noUnkozai * sinio / ecco;
    }
    near.x1mth2 = 1.0 - cosio2;
    near.cc4 = 2.0 * noUnkozai * coef1 * ao * omeosq *
               (near.eta * (2.0 + 0.5 * etasq) + ecco * (0.5 + 2.0 * etasq)
                - J2 * tsi / (ao * psisq) *
                  (-3.0 * near.con41 * (1.0 - 2.0 * eeta + etasq * (1.5 - 0.5 * eeta))
                   + 0.75 * near.x1mth2 * (2.0 * etasq - eeta * (1.0 + etasq)) * std::cos(2.0 * argpo)));
    near.cc5 = 2.0 * coef1 * ao * omeosq * (1.0 + 2.75 * (etasq + eeta) + eeta * etasq);

    // Secular rates
    double cosio4 = cosio2 * cosio2;
    double temp1 = 1.5 * J2 * pinvsq * noUnkozai;
    double temp2 = 0.5 * temp1 * J2 * pinvsq;
    double temp3 = -0.46875 * J4 * pinvsq * pinvsq * noUnkozai;
    near.mdot = noUnkozai + 0.5 * temp1 * rteosq * near.con41
                + 0.0625 * temp2 * rteosq * (13.0 - 78.0 * cosio2 + 137.0 * cosio4);
    near.argpdot = -0.5 * temp1 * con42 + 0.0625 * temp2 * (7.0 - 114.0 * cosio2 + 395.0 * cosio4)
                   + temp3 * (3.0 - 36.0 * cosio2 + 49.0 * cosio4);
    double xhdot1 = -temp1 * cosio;
    near.nodedot = xhdot1 + (0.5 * temp2 * (4.0 - 19.0 * cosio2) + 2.0 * temp3 * (3.0 - 7.0 * cosio2)) * cosio;
    near.omgcof = bstar * cc3 * std::cos(argpo);
    near.xmcof = 0.0;
    if (ecco > 1.0e-4) {
        near.xmcof = -X2O3 * coef * bstar / eeta;
    }
    near.nodecf = 3.5 * omeosq * xhdot1 * near.cc1;
    near.t2cof = 1.5 * near.cc1;

    // Guard against division by zero for inclinations near 180 degrees
    if (std::fabs(cosio + 1.0) > 1.5e-12) {
        near.xlcof = -0.25 * J3OJ2 * sinio * (3.0 + 5.0 * cosio) / (1.0 + cosio);
    } else {
        near.xlcof = -0.25 * J3OJ2 * sinio * (3.0 + 5.0 * cosio) / 1.5e-12;
    }
    near.aycof = -0.5 * J3OJ2 * sinio;
    near.delmo = std::pow(1.0 + near.eta * std::cos(mo), 3);
    near.sinmao = std::sin(mo);
    near.x7thm1 = 7.0 * cosio2 - 1.0;

    if (TWO_PI / noUnkozai >= DEEP_SPACE_PERIOD_MINUTES) {
        deepSpace = true;
        near.simpleDrag = true;
        initializeDeepSpace(sinio, cosio);
    }

    if (!near.simpleDrag) {
        double cc1sq = near.cc1 * near.cc1;
        near.d2 = 4.0 * ao * tsi * cc1sq;
        double temp = near.d2 * tsi * near.cc1 / 3.0;
        near.d3 = (17.0 * ao + sfour) * temp;
        near.d4 = 0.5 * temp * ao * tsi * (221.0 * ao + 31.0 * sfour) * near.cc1;
        near.t3cof = near.d2 + 2.0 * cc1sq;
        near.t4cof = 0.25 * (3.0 * near.d3 + near.cc1 * (12.0 * near.d2 + 10.0 * cc1sq));
        near.t5cof = 0.2 * (3.0 * near.d4 + 12.0 * near.cc1 * near.d3 + 6.0 * near.d2 * near.d2
                            + 15.0 * cc1sq * (2.0 * near.d2 + cc1sq));
    }
}

// Compute lunar-solar terms and deep-space resonance coefficients (dscom, dsinit)
void Model::initializeDeepSpace(double sinim, double cosim) {
    const double em = ecco;
    const double emsq = em * em;
    const double nm = noUnkozai;
    const double sinomm = std::sin(argpo);
    const double cosomm = std::cos(argpo);

    // Days since 1900 Jan 0.5
    double day = epochJD - 2415020.0;
    double xnodce = std::fmod(4.5236020 - 9.2422029e-4 * day, TWO_PI);
    double stem = std::sin(xnodce);
    double ctem = std::cos(xnodce);
    double zcosil = 0.91375164 - 0.03568096 * ctem;
    double zsinil = std::sqrt(1.0 - zcosil * zcosil);
    double zsinhl = 0.089683511 * stem / zsinil;
    double zcoshl = std::sqrt(1.0 - zsinhl * zsinhl);
    double gam = 5.8351514 + 0.0019443680 * day;
    double zx = 0.39785416 * stem / zsinil;
    double zy = zcoshl * ctem + 0.91744867 * zsinhl * stem;
    zx = std::atan2(zx, zy);
    zx = gam + zx - xnodce;
    double zcosgl = std::cos(zx);
    double zsingl = std::sin(zx);

    // Solar terms
    constexpr double ZCOSGS = 0.1945905;
    constexpr double ZSINGS = -0.98088458;
    constexpr double ZCOSIS = 0.91744867;
    constexpr double ZSINIS = 0.39785416;
    BodyOrientation sunOrientation{ZCOSGS, ZSINGS, ZCOSIS, ZSINIS, std::cos(nodeo), std::sin(nodeo)};
    BodyTerms sun = computeBodyTerms(sunOrientation, C1SS, nm, em, sinim, cosim, sinomm, cosomm);

    // Lunar terms
    BodyOrientation moonOrientation{
        zcosgl, zsingl, zcosil, zsinil,
        zcoshl * std::cos(nodeo) + zsinhl * std::sin(nodeo),
        std::sin(nodeo) * zcoshl - std::cos(nodeo) * zsinhl
    };
    BodyTerms moon = computeBodyTerms(moonOrientation, C1L, nm, em, sinim, cosim, sinomm, cosomm);

    lunarSolar.zmol = std::fmod(4.7199672 + 0.22997150 * day - gam, TWO_PI);
    lunarSolar.zmos = std::fmod(6.2565837 + 0.017201977 * day, TWO_PI);
    lunarSolar.sun = computePeriodicTerms(sun, ZES, emsq);
    lunarSolar.moon = computePeriodicTerms(moon, ZEL, emsq);

    // Secular effects of the sun and moon
    const bool nearEquatorial = inclo < 5.2359877e-2 || inclo > M_PI - 5.2359877e-2;
    double ses = sun.s1 * ZNS * sun.s5;
    double sis = sun.s2 * ZNS * (sun.z11 + sun.z13);
    double sls = -ZNS * sun.s3 * (sun.z1 + sun.z3 - 14.0 - 6.0 * emsq);
    double sghs = sun.s4 * ZNS * (sun.z31 + sun.z33 - 6.0);
    double shs = -ZNS * sun.s2 * (sun.z21 + sun.z23);
    if (nearEquatorial) {
        shs = 0.0;
    }
    if (sinim != 0.0) {
        shs = shs / sinim;
    }
    double sgs = sghs - cosim * shs;

    resonance.dedt = ses + moon.s1 * ZNL * moon.s5;
    resonance.didt = sis + moon.s2 * ZNL * (moon.z11 + moon.z13);
    resonance.dmdt = sls - ZNL * moon.s3 * (moon.z1 + moon.z3 - 14.0 - 6.0 * emsq);
    double sghl = moon.s4 * ZNL * (moon.z31 + moon.z33 - 6.0);
    double shll = -ZNL * moon.s2 * (moon.z21 + moon.z23);
    if (nearEquatorial) {
        shll = 0.0;
    }
    resonance.domdt = sgs + sghl;
    resonance.dnodt = shs;
    if (sinim != 0.0) {
        resonance.domdt = resonance.domdt - cosim / sinim * shll;
        resonance.dnodt = resonance.dnodt + shll / sinim;
    }

    // Geopotential resonance for 12 hour and 24 hour orbits
    if (nm > 0.0034906585 && nm < 0.0052359877) {
        resonance.kind = 1;
    } else if (nm >= 8.26e-3 && nm <= 9.24e-3 && em >= 0.5) {
        resonance.kind = 2;
    } else {
        return;
    }

    const double theta = std::fmod(gsto, TWO_PI);
    const double aonv = std::pow(nm / XKE, X2O3);
    const double cosisq = cosim * cosim;

    if (resonance.kind == 2) {
        // Half-day resonance
        double eoc = em * emsq;
        double g201 = -0.306 - (em - 0.64) * 0.440;

        double g211, g310, g322, g410, g422, g520, g521, g532, g533;
        if (em <= 0.65) {
            g211 = 3.616 - 13.2470 * em + 16.2900 * emsq;
            g310 = -19.302 + 117.3900 * em - 228.4190 * emsq + 156.5910 * eoc;
            g322 = -18.9068 + 109.7927 * em - 214.6334 * emsq + 146.5816 * eoc;
            g410 = -41.122 + 242.6940 * em - 471.0940 * emsq + 313.9530 * eoc;
            g422 = -146.407 + 841.8800 * em - 1629.014 * emsq + 1083.4350 * eoc;
            g520 = -532.114 + 3017.977 * em - 5740.032 * emsq + 3708.2760 * eoc;
        } else {
            g211 = -72.099 + 331.819 * em - 508.738 * emsq + 266.724 * eoc;
            g310 = -346.844 + 1582.851 * em - 2415.925 * emsq + 1246.113 * eoc;
            g322 = -342.585 + 1554.908 * em - 2366.899 * emsq + 1215.972 * eoc;
            g410 = -1052.797 + 4758.686 * em - 7193.992 * emsq + 3651.957 * eoc;
            g422 = -3581.690 + 16178.110 * em - 24462.770 * emsq + 12422.520 * eoc;
            if (em > 0.715) {
                g520 = -5149.66 + 29936.92 * em - 54087.36 * emsq + 31324.56 * eoc;
            } else {
                g520 = 1464.74 - 4664.75 * em + 3763.64 * emsq;
            }
        }
        if (em < 0.7) {
            g533 = -919.22770 + 4988.6100 * em - 9064.7700 * emsq + 5542.21 * eoc;
            g521 = -822.71072 + 4568.6173 * em - 8491.4146 * emsq + 5337.524 * eoc;
            g532 = -853.66600 + 4690.2500 * em - 8624.7700 * emsq + 5341.4 * eoc;
        } else {
            g533 = -37995.780 + 161616.52 * em - 229838.20 * emsq + 109377.94 * eoc;
            g521 = -51752.104 + 218913.95 * em - 309468.16 * emsq + 146349.42 * eoc;
            g532 = -40023.880 + 170470.89 * em - 242699.48 * emsq + 115605.82 * eoc;
        }

        double sini2 = sinim * sinim;
        double f220 = 0.75 * (1.0 + 2.0 * cosim + cosisq);
        double f221 = 1.5 * sini2;
        double f321 = 1.875 * sinim * (1.0 - 2.0 * cosim - 3.0 * cosisq);
        double f322 = -1.875 * sinim * (1.0 + 2.0 * cosim - 3.0 * cosisq);
        double f441 = 35.0 * sini2 * f220;
        double f442 = 39.3750 * sini2 * sini2;
        double f522 = 9.84375 * sinim * (sini2 * (1.0 - 2.0 * cosim - 5.0 * cosisq)
                      + 0.33333333 * (-2.0 + 4.0 * cosim + 6.0 * cosisq));
        double f523 = sinim * (4.92187512 * sini2 * (-2.0 - 4.0 * cosim + 10.0 * cosisq)
                      + 6.56250012 * (1.0 + 2.0 * cosim - 3.0 * cosisq));
        double f542 = 29.53125 * sinim * (2.0 - 8.0 * cosim + cosisq * (-12.0 + 8.0 * cosim + 10.0 * cosisq));
        double f543 = 29.53125 * sinim * (-2.0 - 8.0 * cosim + cosisq * (12.0 + 8.0 * cosim - 10.0 * cosisq));

        double xno2 = nm * nm;
        double ainv2 = aonv * aonv;
        double temp1 = 3.0 * xno2 * ainv2;
        double temp = temp1 * ROOT22;
        resonance.d2201 = temp * f220 * g201;
        resonance.d2211 = temp * f221 * g211;
        temp1 = temp1 * aonv;
        temp = temp1 * ROOT32;
        resonance.d3210 = temp * f321 * g310;
        resonance.d3222 = temp * f322 * g322;
        temp1 = temp1 * aonv;
        temp = 2.0 * temp1 * ROOT44;
        resonance.d4410 = temp * f441 * g410;
        resonance.d4422 = temp * f442 * g422;
        temp1 = temp1 * aonv;
        temp = temp1 * ROOT52;
        resonance.d5220 = temp * f522 * g520;
        resonance.d5232 = temp * f523 * g532;
        temp = 2.0 * temp1 * ROOT54;
        resonance.d5421 = temp * f542 * g521;
        resonance.d5433 = temp * f543 * g533;

        resonance.xlamo = std::fmod(mo + nodeo + nodeo - theta - theta, TWO_PI);
        resonance.xfact = near.mdot + resonance.dmdt
                          + 2.0 * (near.nodedot + resonance.dnodt - RPTIM) - noUnkozai;
    } else {
        // Synchronous resonance
        double g200 = 1.0 + emsq * (-2.5 + 0.8125 * emsq);
        double g310 = 1.0 + 2.0 * emsq;
        double g300 = 1.0 + emsq * (-6.0 + 6.60937 * emsq);
        double f220 = 0.75 * (1.0 + cosim) * (1.0 + cosim);
        double f311 = 0.9375 * sinim * sinim * (1.0 + 3.0 * cosim) - 0.75 * (1.0 + cosim);
        double f330 = 1.0 + cosim;
        f330 = 1.875 * f330 * f330 * f330;
        resonance.del1 = 3.0 * nm * nm * aonv * aonv;
        resonance.del2 = 2.0 * resonance.del1 * f220 * g200 * Q22;
        resonance.del3 = 3.0 * resonance.del1 * f330 * g300 * Q33 * aonv;
        resonance.del1 = resonance.del1 * f311 * g310 * Q31 * aonv;
        resonance.xlamo = std::fmod(mo + nodeo + argpo - theta, TWO_PI);
        resonance.xfact = near.mdot + (near.argpdot + near.nodedot) - RPTIM
                          + resonance.dmdt + resonance.domdt + resonance.dnodt - noUnkozai;
    }
}

// ============================================================================
// Deep Space
// ============================================================================

// Apply deep-space secular effects and integrate the resonance terms (dspace)
void Model::applyDeepSpaceSecular(double t, double& em, double& argpm, double& inclm,
                                  double& nodem, double& mm, double& nm) const {
    const ResonanceTerms& r = resonance;
    double theta = std::fmod(gsto + t * RPTIM, TWO_PI);

    em += r.dedt * t;
    inclm += r.didt * t;
    argpm += r.domdt * t;
    nodem += r.dnodt * t;
    mm += r.dmdt * t;

    if (r.kind == 0) {
        return;
    }

    // The integration always starts at epoch so results don't depend on
    // earlier calls
    double atime = 0.0;
    double xni = noUnkozai;
    double xli = r.xlamo;
    double delt = t > 0.0 ? STEPP : STEPN;
    double xndt = 0.0, xldot = 0.0, xnddt = 0.0;
    double ft = 0.0;

    while (true) {
        if (r.kind != 2) {
            // Near-synchronous
            xndt = r.del1 * std::sin(xli - FASX2) + r.del2 * std::sin(2.0 * (xli - FASX4))
                   + r.del3 * std::sin(3.0 * (xli - FASX6));
            xldot = xni + r.xfact;
            xnddt = r.del1 * std::cos(xli - FASX2) + 2.0 * r.del2 * std::cos(2.0 * (xli - FASX4))
                    + 3.0 * r.del3 * std::cos(3.0 * (xli - FASX6));
            xnddt = xnddt * xldot;
        } else {
            // Near half-day
            double xomi = argpo + near.argpdot * atime;
            double x2omi = xomi + xomi;
            double x2li = xli + xli;
            xndt = r.d2201 * std::sin(x2omi + xli - G22) + r.d2211 * std::sin(xli - G22)
                   + r.d3210 * std::sin(xomi + xli - G32) + r.d3222 * std::sin(-xomi + xli - G32)
                   + r.d4410 * std::sin(x2omi + x2li - G44) + r.d4422 * std::sin(x2li - G44)
                   + r.d5220 * std::sin(xomi + xli - G52) + r.d5232 * std::sin(-xomi + xli - G52)
                   + r.d5421 * std::sin(xomi + x2li - G54) + r.d5433 * std::sin(-xomi + x2li - G54);
            xldot = xni + r.xfact;
            xnddt = r.d2201 * std::cos(x2omi + xli - G22) + r.d2211 * std::cos(xli - G22)
                    + r.d3210 * std::cos(xomi + xli - G32) + r.d3222 * std::cos(-xomi + xli - G32)
                    + r.d5220 * std::cos(xomi + xli - G52) + r.d5232 * std::cos(-xomi + xli - G52)
                    + 2.0 * (r.d4410 * std::cos(x2omi + x2li - G44) + r.d4422 * std::cos(x2li - G44)
                             + r.d5421 * std::cos(xomi + x2li - G54) + r.d5433 * std::cos(-xomi + x2li - G54));
            xnddt = xnddt * xldot;
        }

        if (std::fabs(t - atime) >= STEPP) {
            xli = xli + xldot * delt + xndt * STEP2;
            xni = xni + xndt * delt + xnddt * STEP2;
            atime = atime + delt;
        } else {
            ft = t - atime;
            break;
        }
    }

    nm = xni + xndt * ft + xnddt * ft * ft * 0.5;
    double xl = xli + xldot * ft + xndt * ft * ft * 0.5;
    if (r.kind != 1) {
        mm = xl - 2.0 * nodem + 2.0 * theta;
    } else {
        mm = xl - nodem - argpm + theta;
    }
}

// Apply lunar-solar periodics (dpper)
void Model::applyLunarSolarPeriodics(double t, double& ep, double& inclp, double& nodep,
                                     double& argpp, double& mp) const {
    const LunarSolarTerms& ls = lunarSolar;
    Perturbation sun = evaluatePeriodicTerms(ls.sun, ls.zmos + ZNS * t, ZES);
    Perturbation moon = evaluatePeriodicTerms(ls.moon, ls.zmol + ZNL * t, ZEL);

    double pe = sun.e + moon.e;
    double pinc = sun.i + moon.i;
    double pl = sun.l + moon.l;
    double pgh = sun.gh + moon.gh;
    double ph = sun.h + moon.h;

    inclp = inclp + pinc;
    ep = ep + pe;
    double sinip = std::sin(inclp);
    double cosip = std::cos(inclp);

    if (inclp >= 0.2) {
        ph = ph / sinip;
        pgh = pgh - cosip * ph;
        argpp = argpp + pgh;
        nodep = nodep + ph;
        mp = mp + pl;
    } else {
        // Lyddane modification for low inclinations
        double sinop = std::sin(nodep);
        double cosop = std::cos(nodep);
        double alfdp = sinip * sinop;
        double betdp = sinip * cosop;
        double dalf = ph * cosop + pinc * cosip * sinop;
        double dbet = -ph * sinop + pinc * cosip * cosop;
        alfdp = alfdp + dalf;
        betdp = betdp + dbet;
        nodep = std::fmod(nodep, TWO_PI);
        if (nodep < 0.0) {
            nodep += TWO_PI;
        }
        double xls = mp + argpp + cosip * nodep;
        double dls = pl + pgh - pinc * nodep * sinip;
        xls = xls + dls;
        double xnoh = nodep;
        nodep = std::atan2(alfdp, betdp);
        if (nodep < 0.0) {
            nodep += TWO_PI;
        }
        if (std::fabs(xnoh - nodep) > M_PI) {
            if (nodep < xnoh) {
                nodep += TWO_PI;
            } else {
                nodep -= TWO_PI;
            }
        }
        mp = mp + pl;
        argpp = xls - mp - cosip * nodep;
    }
}

// ============================================================================
// Propagation
// ============================================================================

StateVector Model::propagate(double tsince) const {
    const double t = tsince;

    // Secular gravity and atmospheric drag
    double xmdf = mo + near.mdot * t;
    double argpdf = argpo + near.argpdot * t;
    double nodedf = nodeo + near.nodedot * t;
    double argpm = argpdf;
    double mm = xmdf;
    double t2 = t * t;
    double nodem = nodedf + near.nodecf * t2;
    double tempa = 1.0 - near.cc1 * t;
    double tempe = bstar * near.cc4 * t;
    double templ = near.t2cof * t2;

    if (!near.simpleDrag) {
        double delomg = near.omgcof * t;
        double delmtemp = 1.0 + near.eta * std::cos(xmdf);
        double delm = near.xmcof * (delmtemp * delmtemp * delmtemp - near.delmo);
        double temp = delomg + delm;
        mm = xmdf + temp;
        argpm = argpdf - temp;
        double t3 = t2 * t;
        double t4 = t3 * t;
        tempa = tempa - near.d2 * t2 - near.d3 * t3 - near.d4 * t4;
        tempe = tempe + bstar * near.cc5 * (std::sin(mm) - near.sinmao);
        templ = templ + near.t3cof * t3 + t4 * (near.t4cof + t * near.t5cof);
    }

    double nm = noUnkozai;
    double em = ecco;
    double inclm = inclo;
    if (deepSpace) {
        applyDeepSpaceSecular(t, em, argpm, inclm, nodem, mm, nm);
    }

    if (nm <= 0.0) {
        throw InvalidOrbitException(fmt::format("Mean motion is not positive after {} minutes", t));
    }

    double am = std::pow(XKE / nm, X2O3) * tempa * tempa;
    nm = XKE / std::pow(am, 1.5);
    em = em - tempe;

    if (em >= 1.0 || em < -0.001) {
        throw InvalidOrbitException(fmt::format("Eccentricity out of range during propagation: {}", em));
    }
    if (em < 1.0e-6) {
        em = 1.0e-6;
    }

    mm = mm + noUnkozai * templ;
    double xlm = mm + argpm + nodem;
    nodem = std::fmod(nodem, TWO_PI);
    argpm = std::fmod(argpm, TWO_PI);
    xlm = std::fmod(xlm, TWO_PI);
    mm = std::fmod(xlm - argpm - nodem, TWO_PI);

    // Lunar-solar periodics
    double ep = em;
    double xincp = inclm;
    double argpp = argpm;
    double nodep = nodem;
    double mp = mm;
    double sinip = std::sin(xincp);
    double cosip = std::cos(xincp);

    double aycof = near.aycof;
    double xlcof = near.xlcof;
    double con41 = near.con41;
    double x1mth2 = near.x1mth2;
    double x7thm1 = near.x7thm1;

    if (deepSpace) {
        applyLunarSolarPeriodics(t, ep, xincp, nodep, argpp, mp);
        if (xincp < 0.0) {
            xincp = -xincp;
            nodep = nodep + M_PI;
            argpp = argpp - M_PI;
        }
        if (ep < 0.0 || ep > 1.0) {
            throw InvalidOrbitException(fmt::format("Perturbed eccentricity out of range: {}", ep));
        }

        sinip = std::sin(xincp);
        cosip = std::cos(xincp);
        aycof = -0.5 * J3OJ2 * sinip;
        if (std::fabs(cosip + 1.0) > 1.5e-12) {
            xlcof = -0.25 * J3OJ2 * sinip * (3.0 + 5.0 * cosip) / (1.0 + cosip);
        } else {
            xlcof = -0.25 * J3OJ2 * sinip * (3.0 + 5.0 * cosip) / 1.5e-12;
        }
        double cosisq = cosip * cosip;
        con41 = 3.0 * cosisq - 1.0;
        x1mth2 = 1.0 - cosisq;
        x7thm1 = 7.0 * cosisq - 1.0;
    }

    // Long period periodics
    double axnl = ep * std::cos(argpp);
    double temp = 1.0 / (am * (1.0 - ep * ep));
    double aynl = ep * std::sin(argpp) + temp * aycof;
    double xl = mp + argpp + nodep + temp * xlcof * axnl;

    // Solve Kepler's equation
    double u = std::fmod(xl - nodep, TWO_PI);
    double eo1 = u;
    double tem5 = 9999.9;
    int ktr = 1;
    double sineo1 = 0.0;
    double coseo1 = 0.0;
    while (std::fabs(tem5) >= 1.0e-12 && ktr <= 10) {
        sineo1 = std::sin(eo1);
        coseo1 = std::cos(eo1);
        tem5 = 1.0 - coseo1 * axnl - sineo1 * aynl;
        tem5 = (u - aynl * coseo1 + axnl * sineo1 - eo1) / tem5;
        if (std::fabs(tem5) >= 0.95) {
            tem5 = tem5 > 0.0 ? 0.95 : -0.95;
        }
        eo1 = eo1 + tem5;
        ktr++;
    }

    // Short period preliminary quantities
    double ecose = axnl * coseo1 + aynl * sineo1;
    double esine = axnl * sineo1 - aynl * coseo1;
    double el2 = axnl * axnl + aynl * aynl;
    double pl = am * (1.0 - el2);
    if (pl < 0.0) {
        throw InvalidOrbitException("Semi-latus rectum is negative");
    }

    double rl = am * (1.0 - ecose);
    double rdotl = std::sqrt(am) * esine / rl;
    double rvdotl = std::sqrt(pl) / rl;
    double betal = std::sqrt(1.0 - el2);
    temp = esine / (1.0 + betal);
    double sinu = am / rl * (sineo1 - aynl - axnl * temp);
    double cosu = am / rl * (coseo1 - axnl + aynl * temp);
    double su = std::atan2(sinu, cosu);
    double sin2u = (cosu + cosu) * sinu;
    double cos2u = 1.0 - 2.0 * sinu * sinu;
    temp = 1.0 / pl;
    double temp1 = 0.5 * J2 * temp;
    double temp2 = temp1 * temp;

    // Short period periodics
    double mrt = rl * (1.0 - 1.5 * temp2 * betal * con41) + 0.5 * temp1 * x1mth2 * cos2u;
    su = su - 0.25 * temp2 * x7thm1 * sin2u;
    double xnode = nodep + 1.5 * temp2 * cosip * sin2u;
    double xinc = xincp + 1.5 * temp2 * cosip * sinip * cos2u;
    double mvt = rdotl - nm * temp1 * x1mth2 * sin2u / XKE;
    double rvdot = rvdotl + nm * temp1 * (x1mth2 * cos2u + 1.5 * con41) / XKE;

    if (mrt < 1.0) {
        throw SatelliteDecayedException();
    }

    // Orientation vectors
    double sinsu = std::sin(su);
    double cossu = std::cos(su);
    double snod = std::sin(xnode);
    double cnod = std::cos(xnode);
    double sini = std::sin(xinc);
    double cosi = std::cos(xinc);
    double xmx = -snod * cosi;
    double xmy = cnod * cosi;
    double ux = xmx * sinsu + cnod * cossu;
    double uy = xmy * sinsu + snod * cossu;
    double uz = sini * sinsu;
    double vx = xmx * cossu - cnod * sinsu;
    double vy = xmy * cossu - snod * sinsu;
    double vz = sini * cossu;

    StateVector result;
    result.r[0] = mrt * ux * RADIUS_EARTH_KM;
    result.r[1] = mrt * uy * RADIUS_EARTH_KM;
    result.r[2] = mrt * uz * RADIUS_EARTH_KM;
    result.v[0] = (mvt * ux + rvdot * vx) * VKMPERSEC;
    result.v[1] = (mvt * uy + rvdot * vy) * VKMPERSEC;
    result.v[2] = (mvt * uz + rvdot * vz) * VKMPERSEC;
    return result;
}

} // namespace skywatch::sgp4
